#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "vscrubsdk/job_model.h"

namespace vscrub::sdk {

struct TrackKey {
  int chunk_index = 0;
  std::int64_t local_track_id = 0;

  bool operator<(const TrackKey& o) const {
    return chunk_index != o.chunk_index ? chunk_index < o.chunk_index : local_track_id < o.local_track_id;
  }
  bool operator==(const TrackKey& o) const {
    return chunk_index == o.chunk_index && local_track_id == o.local_track_id;
  }
};

// One accepted pairing across the seam between chunk `left_index` and `left_index + 1`.
struct SeamMatch {
  int left_index = 0;
  std::int64_t left_track_id = 0;
  std::int64_t right_track_id = 0;
  double similarity = 0.0;
};

// (chunk_index, local_track_id) -> global_track_id. Global ids start at 1 and are
// numbered by the smallest member of each identity.
class GlobalIdentityMap {
 public:
  std::optional<std::int64_t> lookup(int chunk_index, std::int64_t local_track_id) const;

  const std::map<TrackKey, std::int64_t>& entries() const { return ids_; }
  const std::vector<SeamMatch>& matches() const { return matches_; }
  std::size_t identity_count() const { return identity_count_; }

  nlohmann::json to_json() const;

  bool operator==(const GlobalIdentityMap& o) const { return ids_ == o.ids_; }

 private:
  friend class ContinuityResolver;

  std::map<TrackKey, std::int64_t> ids_;
  std::vector<SeamMatch> matches_;
  std::size_t identity_count_ = 0;
};

// 0 when either vector is empty, lengths differ or a norm is zero.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Greedy one-to-one matching of the tail tracks of a chunk against the head tracks of
// its successor, same class only, best similarity first, accepted when >= tau.
std::vector<SeamMatch> match_seam(int left_index, const std::vector<TrackSummary>& tail,
                                  const std::vector<TrackSummary>& head, double tau);

// Chains seam matches into global identities. Depends only on the persisted boundary
// summaries, never on the order chunks completed in.
class ContinuityResolver {
 public:
  explicit ContinuityResolver(double tau = 0.75) : tau_(tau) {}

  GlobalIdentityMap resolve(std::vector<Chunk> chunks) const;

  double tau() const { return tau_; }

 private:
  double tau_;
};

}  // namespace vscrub::sdk
