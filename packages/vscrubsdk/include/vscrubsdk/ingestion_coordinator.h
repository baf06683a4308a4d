#pragma once

#include <cstdint>
#include <vector>

#include "vscrubsdk/blob_store.h"
#include "vscrubsdk/job_state_store.h"
#include "vscrubsdk/notifier.h"
#include "vscrubsdk/task_dispatcher.h"

namespace vscrub::sdk {

// Handles INGEST: probes the input, splits it into overlapping chunks, seeds the
// chunk records and dispatches one CHUNK task per index.
class IngestionCoordinator {
 public:
  struct Config {
    double chunk_duration_s = 60.0;
    double overlap_s = 5.0;
    int io_retry_attempts = 3;
    std::int64_t io_backoff_base_ms = 200;
    std::int64_t io_backoff_max_ms = 5000;
  };

  IngestionCoordinator(Config cfg, JobStateStore* state, BlobStore* blobs, TaskDispatcher* dispatcher,
                       JobNotifier* notifier = nullptr);

  // ceil(duration / D) chunks; chunk i covers [i*D - W, (i+1)*D + W) clamped to
  // [0, duration) and renders its core [i*D, min((i+1)*D, duration)).
  static std::vector<ChunkSpan> plan_chunks(double duration_s, double chunk_duration_s, double overlap_s);

  HandlerOutcome handle(const Task& task, const TaskContext& ctx);

 private:
  std::optional<double> probe_duration(const Job& job, OpError& err);
  HandlerOutcome dispatch_pending_chunks(const std::string& job_id);
  void fail(const std::string& job_id, ErrorCode code, const std::string& message);

  Config cfg_;
  JobStateStore* state_ = nullptr;
  BlobStore* blobs_ = nullptr;
  TaskDispatcher* dispatcher_ = nullptr;
  JobNotifier* notifier_ = nullptr;
};

}  // namespace vscrub::sdk
