#pragma once

#include <cstdint>
#include <string>

#include "vscrubsdk/blob_store.h"
#include "vscrubsdk/chunk_pipeline.h"
#include "vscrubsdk/job_state_store.h"
#include "vscrubsdk/notifier.h"
#include "vscrubsdk/task_dispatcher.h"

namespace vscrub::sdk {

// Handles CHUNK tasks. Safe under duplicate and concurrent delivery: a DONE chunk
// is only re-counted, the claim bounds the attempts, and the job is re-checked for
// a terminal state before every write.
class ChunkHandler {
 public:
  struct Config {
    int max_attempts = 3;
    std::int64_t heartbeat_ms = 60000;
    double overlap_s = 5.0;
    int io_retry_attempts = 3;
    std::int64_t io_backoff_base_ms = 200;
    std::int64_t io_backoff_max_ms = 5000;
  };

  ChunkHandler(Config cfg, JobStateStore* state, BlobStore* blobs, ChunkPipeline* pipeline,
               TaskDispatcher* dispatcher, JobNotifier* notifier = nullptr);

  HandlerOutcome handle(const Task& task, const TaskContext& ctx);

 private:
  HandlerOutcome settle_done(const std::string& job_id, int index);
  HandlerOutcome commit(const std::string& job_id, int index, const ChunkRenderResult& rendered);
  HandlerOutcome on_failure(const std::string& job_id, const Chunk& claimed, ErrorCode code,
                            const std::string& message);

  ChunkRenderRequest make_request(const Job& job, const Chunk& chunk, const std::string& input_path,
                                  const TaskContext& ctx) const;

  enum class Liveness : std::uint8_t { kLive, kGone, kUnknown };

  // kGone once the job is deleted or terminal; in-flight work must stop writing.
  // kUnknown when the job record could not be read.
  Liveness job_liveness(const std::string& job_id) const;
  void notify_if_failed(const std::string& job_id);

  Config cfg_;
  JobStateStore* state_ = nullptr;
  BlobStore* blobs_ = nullptr;
  ChunkPipeline* pipeline_ = nullptr;
  TaskDispatcher* dispatcher_ = nullptr;
  JobNotifier* notifier_ = nullptr;
};

}  // namespace vscrub::sdk
