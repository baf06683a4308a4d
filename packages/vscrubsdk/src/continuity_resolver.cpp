#include "vscrubsdk/continuity_resolver.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>

namespace vscrub::sdk {

using json = nlohmann::json;

namespace {

class DisjointSets {
 public:
  explicit DisjointSets(std::size_t n) : parent_(n), rank_(n, 0) { std::iota(parent_.begin(), parent_.end(), 0); }

  std::size_t find(std::size_t x) {
    while (parent_[x] != x) {
      parent_[x] = parent_[parent_[x]];
      x = parent_[x];
    }
    return x;
  }

  void unite(std::size_t a, std::size_t b) {
    a = find(a);
    b = find(b);
    if (a == b) return;
    if (rank_[a] < rank_[b]) std::swap(a, b);
    parent_[b] = a;
    if (rank_[a] == rank_[b]) ++rank_[a];
  }

 private:
  std::vector<std::size_t> parent_;
  std::vector<int> rank_;
};

}  // namespace

std::optional<std::int64_t> GlobalIdentityMap::lookup(int chunk_index, std::int64_t local_track_id) const {
  auto it = ids_.find(TrackKey{chunk_index, local_track_id});
  if (it == ids_.end()) return std::nullopt;
  return it->second;
}

json GlobalIdentityMap::to_json() const {
  std::map<std::int64_t, json> by_id;
  for (const auto& [key, gid] : ids_) {
    auto& members = by_id[gid];
    if (members.is_null()) members = json::array();
    members.push_back(json{{"chunkIndex", key.chunk_index}, {"localTrackId", key.local_track_id}});
  }
  json identities = json::array();
  for (auto& [gid, members] : by_id) {
    identities.push_back(json{{"globalTrackId", gid}, {"members", std::move(members)}});
  }
  json seams = json::array();
  for (const auto& m : matches_) {
    seams.push_back(json{{"leftIndex", m.left_index},
                         {"leftTrackId", m.left_track_id},
                         {"rightTrackId", m.right_track_id},
                         {"similarity", m.similarity}});
  }
  return json{{"identities", std::move(identities)}, {"matches", std::move(seams)}};
}

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.empty() || a.size() != b.size()) return 0.0;
  double dot = 0.0;
  double na = 0.0;
  double nb = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    na += static_cast<double>(a[i]) * a[i];
    nb += static_cast<double>(b[i]) * b[i];
  }
  if (na <= 0.0 || nb <= 0.0) return 0.0;
  return dot / (std::sqrt(na) * std::sqrt(nb));
}

std::vector<SeamMatch> match_seam(int left_index, const std::vector<TrackSummary>& tail,
                                  const std::vector<TrackSummary>& head, double tau) {
  std::vector<SeamMatch> candidates;
  for (const auto& l : tail) {
    for (const auto& r : head) {
      if (l.class_label != r.class_label) continue;
      const double sim = cosine_similarity(l.embedding, r.embedding);
      // Non-finite embeddings never match.
      if (!std::isfinite(sim) || sim < tau) continue;
      candidates.push_back(SeamMatch{left_index, l.local_track_id, r.local_track_id, sim});
    }
  }
  // Ties break on track ids so the outcome never depends on input order.
  std::sort(candidates.begin(), candidates.end(), [](const SeamMatch& x, const SeamMatch& y) {
    if (x.similarity != y.similarity) return x.similarity > y.similarity;
    if (x.left_track_id != y.left_track_id) return x.left_track_id < y.left_track_id;
    return x.right_track_id < y.right_track_id;
  });

  std::set<std::int64_t> used_left;
  std::set<std::int64_t> used_right;
  std::vector<SeamMatch> accepted;
  for (const auto& c : candidates) {
    if (used_left.count(c.left_track_id) > 0 || used_right.count(c.right_track_id) > 0) continue;
    used_left.insert(c.left_track_id);
    used_right.insert(c.right_track_id);
    accepted.push_back(c);
  }
  return accepted;
}

GlobalIdentityMap ContinuityResolver::resolve(std::vector<Chunk> chunks) const {
  std::sort(chunks.begin(), chunks.end(), [](const Chunk& a, const Chunk& b) { return a.index < b.index; });

  std::map<TrackKey, std::size_t> node_of;
  auto add_node = [&](int chunk_index, std::int64_t track_id) {
    node_of.emplace(TrackKey{chunk_index, track_id}, 0);
  };
  for (const auto& c : chunks) {
    for (const auto& t : c.head_tracks) add_node(c.index, t.local_track_id);
    for (const auto& t : c.boundary_tracks) add_node(c.index, t.local_track_id);
  }
  std::size_t next = 0;
  for (auto& [key, node] : node_of) node = next++;

  GlobalIdentityMap out;
  DisjointSets sets(node_of.size());
  for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
    const Chunk& left = chunks[i];
    const Chunk& right = chunks[i + 1];
    if (right.index != left.index + 1) continue;
    for (const auto& m : match_seam(left.index, left.boundary_tracks, right.head_tracks, tau_)) {
      sets.unite(node_of.at(TrackKey{left.index, m.left_track_id}), node_of.at(TrackKey{right.index, m.right_track_id}));
      out.matches_.push_back(m);
    }
  }

  // node_of iterates in key order, so the first member seen of a set is its smallest.
  std::map<std::size_t, std::int64_t> gid_of_root;
  for (const auto& [key, node] : node_of) {
    const std::size_t root = sets.find(node);
    auto it = gid_of_root.find(root);
    if (it == gid_of_root.end()) {
      it = gid_of_root.emplace(root, static_cast<std::int64_t>(gid_of_root.size() + 1)).first;
    }
    out.ids_[key] = it->second;
  }
  out.identity_count_ = gid_of_root.size();
  return out;
}

}  // namespace vscrub::sdk
