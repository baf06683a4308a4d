#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "vscrubsdk/blob_store.h"
#include "vscrubsdk/continuity_resolver.h"
#include "vscrubsdk/job_state_store.h"
#include "vscrubsdk/notifier.h"
#include "vscrubsdk/task_dispatcher.h"

namespace vscrub::sdk {

// Joins rendered chunk files in order into one container with a normalized codec
// and no source metadata. `keepalive` is called periodically while frames are
// re-encoded. Throws ProcessingError.
class VideoConcatenator {
 public:
  virtual ~VideoConcatenator() = default;
  virtual std::vector<std::uint8_t> concatenate(const std::vector<std::string>& chunk_paths,
                                                const std::function<void()>& keepalive) = 0;
};

// Handles STITCH. Runs only for STITCHING jobs; the final STITCHING -> COMPLETED
// CAS makes concurrent or repeated stitches converge on one result.
class StitchCoordinator {
 public:
  struct Config {
    double tau = 0.75;
    int io_retry_attempts = 3;
    std::int64_t io_backoff_base_ms = 200;
    std::int64_t io_backoff_max_ms = 5000;
  };

  StitchCoordinator(Config cfg, JobStateStore* state, BlobStore* blobs, VideoConcatenator* concatenator,
                    JobNotifier* notifier = nullptr);

  HandlerOutcome handle(const Task& task, const TaskContext& ctx);

 private:
  bool put_with_retry(const std::string& job_id, const std::vector<std::uint8_t>& bytes, std::string& ref,
                      OpError& err);
  HandlerOutcome fail(const std::string& job_id, ErrorCode code, const std::string& message);

  Config cfg_;
  JobStateStore* state_ = nullptr;
  BlobStore* blobs_ = nullptr;
  VideoConcatenator* concatenator_ = nullptr;
  JobNotifier* notifier_ = nullptr;
  ContinuityResolver resolver_;
};

}  // namespace vscrub::sdk
