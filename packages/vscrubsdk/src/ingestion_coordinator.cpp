#include "vscrubsdk/ingestion_coordinator.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "vscrubsdk/time_utils.h"

namespace vscrub::sdk {

IngestionCoordinator::IngestionCoordinator(Config cfg, JobStateStore* state, BlobStore* blobs,
                                           TaskDispatcher* dispatcher, JobNotifier* notifier)
    : cfg_(cfg), state_(state), blobs_(blobs), dispatcher_(dispatcher), notifier_(notifier) {
  if (state_ == nullptr || blobs_ == nullptr || dispatcher_ == nullptr) {
    throw std::invalid_argument("IngestionCoordinator requires state, blobs and dispatcher");
  }
}

std::vector<ChunkSpan> IngestionCoordinator::plan_chunks(double duration_s, double chunk_duration_s,
                                                         double overlap_s) {
  std::vector<ChunkSpan> spans;
  if (!(duration_s > 0.0) || !(chunk_duration_s > 0.0)) {
    return spans;
  }
  const double w = std::max(0.0, overlap_s);
  // Tolerate float noise so that 120 / 60 stays 2 chunks.
  const int count = std::max(1, static_cast<int>(std::ceil(duration_s / chunk_duration_s - 1e-9)));
  spans.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    ChunkSpan s;
    s.index = i;
    s.core_start_s = i * chunk_duration_s;
    s.core_end_s = std::min((i + 1) * chunk_duration_s, duration_s);
    s.start_s = std::max(0.0, s.core_start_s - w);
    s.end_s = std::min(duration_s, s.core_end_s + w);
    spans.push_back(s);
  }
  return spans;
}

void IngestionCoordinator::fail(const std::string& job_id, ErrorCode code, const std::string& message) {
  JobError e;
  e.code = code;
  e.message = message;
  if (state_->fail_job(job_id, e) == TransitionResult::kApplied && notifier_ != nullptr) {
    if (auto job = state_->get_job(job_id)) {
      notifier_->job_finished(*job);
    }
  }
}

std::optional<double> IngestionCoordinator::probe_duration(const Job& job, OpError& err) {
  for (int attempt = 1; attempt <= cfg_.io_retry_attempts; ++attempt) {
    err = OpError{};
    auto duration = blobs_->probe(job.input_ref, &err);
    if (duration.has_value()) {
      return duration;
    }
    if (!is_retryable(err.code) || attempt == cfg_.io_retry_attempts) {
      break;
    }
    const auto delay = backoff_ms(attempt, cfg_.io_backoff_base_ms, cfg_.io_backoff_max_ms);
    spdlog::warn("probe failed jobId={} attempt={} retryInMs={} err={}", job.job_id, attempt, delay, err.message);
    sleep_ms(delay);
  }
  return std::nullopt;
}

HandlerOutcome IngestionCoordinator::dispatch_pending_chunks(const std::string& job_id) {
  std::vector<Chunk> chunks;
  if (state_->load_chunks(job_id, chunks) == StoreStatus::kError) {
    spdlog::warn("chunk records unreadable, retrying dispatch jobId={}", job_id);
    return HandlerOutcome::kRetry;
  }
  int dispatched = 0;
  for (const auto& chunk : chunks) {
    if (chunk.status == ChunkStatus::kDone || chunk.status == ChunkStatus::kFailed) {
      continue;
    }
    if (!dispatcher_->enqueue_chunk(job_id, chunk.index, chunk.attempt_count)) {
      return HandlerOutcome::kRetry;  // redelivered INGEST re-dispatches what is still pending
    }
    ++dispatched;
  }
  spdlog::info("chunk tasks dispatched jobId={} count={}", job_id, dispatched);
  return HandlerOutcome::kAck;
}

HandlerOutcome IngestionCoordinator::handle(const Task& task, const TaskContext& ctx) {
  const std::string& job_id = task.job_id;
  // QUEUED -> CHUNKING -> PROCESSING, re-reading the record after every step.
  for (int step = 0; step < 8; ++step) {
    Job current;
    const StoreStatus js = state_->load_job(job_id, current);
    if (js == StoreStatus::kError) {
      spdlog::warn("job record unreadable, retrying ingest jobId={}", job_id);
      return HandlerOutcome::kRetry;
    }
    if (js == StoreStatus::kNotFound) {
      spdlog::warn("ingest for unknown job jobId={}", job_id);
      return HandlerOutcome::kAck;
    }
    const Job* job = &current;

    switch (job->status) {
      case JobStatus::kQueued: {
        const auto r = state_->transition_job(job_id, JobStatus::kQueued, JobStatus::kChunking);
        if (r == TransitionResult::kStoreError) return HandlerOutcome::kRetry;
        if (r == TransitionResult::kNotFound) return HandlerOutcome::kAck;
        continue;
      }

      case JobStatus::kChunking: {
        if (!job->chunk_count.has_value()) {
          OpError err;
          const auto duration = probe_duration(*job, err);
          if (!duration.has_value()) {
            if (is_retryable(err.code)) {
              spdlog::warn("probe unavailable jobId={} delivery={} err={}", job_id, ctx.delivery_count, err.message);
              return HandlerOutcome::kRetry;
            }
            fail(job_id, ErrorCode::kCorruptInput, "unreadable input: " + err.message);
            return HandlerOutcome::kAck;
          }
          if (!(*duration > 0.0) || !std::isfinite(*duration)) {
            fail(job_id, ErrorCode::kCorruptInput, "input has no playable duration");
            return HandlerOutcome::kAck;
          }
          const auto spans = plan_chunks(*duration, cfg_.chunk_duration_s, cfg_.overlap_s);
          const auto r = state_->create_chunks(job_id, spans, *duration);
          if (r == TransitionResult::kStoreError) return HandlerOutcome::kRetry;
          if (r == TransitionResult::kNotFound) return HandlerOutcome::kAck;
          continue;
        }
        const auto r = state_->transition_job(job_id, JobStatus::kChunking, JobStatus::kProcessing);
        if (r == TransitionResult::kStoreError) return HandlerOutcome::kRetry;
        if (r == TransitionResult::kNotFound) return HandlerOutcome::kAck;
        continue;
      }

      case JobStatus::kProcessing:
        return dispatch_pending_chunks(job_id);

      case JobStatus::kStitching:
      case JobStatus::kCompleted:
      case JobStatus::kFailed:
        spdlog::debug("ingest no-op jobId={} status={}", job_id, to_string(job->status));
        return HandlerOutcome::kAck;
    }
  }
  spdlog::warn("ingest did not settle jobId={}", job_id);
  return HandlerOutcome::kRetry;
}

}  // namespace vscrub::sdk
