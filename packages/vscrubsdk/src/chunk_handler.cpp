#include "vscrubsdk/chunk_handler.h"

#include <algorithm>
#include <exception>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "vscrubsdk/time_utils.h"

namespace vscrub::sdk {

namespace {

// Unclassified pipeline failures consume the attempt budget like retryable ones.
bool consumes_budget(ErrorCode code) { return is_retryable(code) || code == ErrorCode::kInternal; }

}  // namespace

ChunkHandler::ChunkHandler(Config cfg, JobStateStore* state, BlobStore* blobs, ChunkPipeline* pipeline,
                           TaskDispatcher* dispatcher, JobNotifier* notifier)
    : cfg_(cfg), state_(state), blobs_(blobs), pipeline_(pipeline), dispatcher_(dispatcher), notifier_(notifier) {
  if (state_ == nullptr || blobs_ == nullptr || pipeline_ == nullptr || dispatcher_ == nullptr) {
    throw std::invalid_argument("ChunkHandler requires state, blobs, pipeline and dispatcher");
  }
}

ChunkHandler::Liveness ChunkHandler::job_liveness(const std::string& job_id) const {
  Job job;
  const StoreStatus s = state_->load_job(job_id, job);
  if (s == StoreStatus::kError) {
    return Liveness::kUnknown;
  }
  return s == StoreStatus::kOk && !is_terminal(job.status) ? Liveness::kLive : Liveness::kGone;
}

void ChunkHandler::notify_if_failed(const std::string& job_id) {
  if (notifier_ == nullptr) return;
  const auto job = state_->get_job(job_id);
  if (job.has_value() && job->status == JobStatus::kFailed) {
    notifier_->job_finished(*job);
  }
}

ChunkRenderRequest ChunkHandler::make_request(const Job& job, const Chunk& chunk, const std::string& input_path,
                                              const TaskContext& ctx) const {
  ChunkRenderRequest req;
  req.job_id = job.job_id;
  req.index = chunk.index;
  req.input_path = input_path;
  req.span = chunk.span;
  req.profile = job.profile;
  req.options = job.options;

  const double w = std::max(0.0, cfg_.overlap_s);
  const ChunkSpan& s = chunk.span;
  const bool first = chunk.index == 0;
  const bool last = job.chunk_count.has_value() && chunk.index + 1 >= *job.chunk_count;
  req.head_window_begin_s = s.start_s;
  req.head_window_end_s = first ? s.start_s : std::min(s.end_s, s.core_start_s + w);
  req.tail_window_begin_s = last ? s.end_s : std::max(s.start_s, s.core_end_s - w);
  req.tail_window_end_s = s.end_s;

  const std::string job_id = job.job_id;
  JobStateStore* state = state_;
  req.should_abort = [state, job_id]() {
    Job j;
    const StoreStatus s = state->load_job(job_id, j);
    // A failed read is not a cancellation; keep rendering.
    return s == StoreStatus::kNotFound || (s == StoreStatus::kOk && is_terminal(j.status));
  };

  const int index = chunk.index;
  const std::int64_t interval = cfg_.heartbeat_ms;
  auto last_touch = std::make_shared<std::int64_t>(now_ms());
  req.keepalive = [keepalive = ctx.keepalive, state, job_id, index, interval, last_touch]() {
    if (keepalive) keepalive();
    const std::int64_t now = now_ms();
    if (interval <= 0 || now - *last_touch < interval) return;
    *last_touch = now;
    const TransitionResult r = state->touch_chunk(job_id, index);
    if (r == TransitionResult::kStoreError) {
      spdlog::warn("chunk heartbeat failed jobId={} index={}", job_id, index);
    }
  };
  return req;
}

HandlerOutcome ChunkHandler::settle_done(const std::string& job_id, int index) {
  const CompletionResult r = state_->increment_and_check_completion(job_id, index);
  if (r.result == TransitionResult::kStoreError) {
    return HandlerOutcome::kRetry;
  }
  if (r.trigger_stitch && !dispatcher_->enqueue_stitch(job_id)) {
    return HandlerOutcome::kRetry;  // a stale STITCHING job is re-driven by the reconciler
  }
  return HandlerOutcome::kAck;
}

HandlerOutcome ChunkHandler::on_failure(const std::string& job_id, const Chunk& claimed, ErrorCode code,
                                        const std::string& message) {
  const int index = claimed.index;
  const Liveness live = job_liveness(job_id);
  if (live == Liveness::kUnknown) {
    spdlog::warn("chunk failure not recorded, job unreadable jobId={} index={} err={}", job_id, index, message);
    return HandlerOutcome::kRetry;
  }
  if (code == ErrorCode::kCancelled || live == Liveness::kGone) {
    spdlog::info("chunk aborted jobId={} index={} reason={}", job_id, index, message);
    return HandlerOutcome::kAck;
  }

  JobError cause;
  cause.code = code;
  cause.message = message;
  cause.chunk_index = index;

  if (!consumes_budget(code)) {
    spdlog::error("chunk failed jobId={} index={} code={} err={}", job_id, index, to_string(code), message);
    if (state_->fail_chunk(job_id, index, cause) == TransitionResult::kStoreError) {
      return HandlerOutcome::kRetry;
    }
    notify_if_failed(job_id);
    return HandlerOutcome::kAck;
  }

  if (claimed.attempt_count >= cfg_.max_attempts) {
    cause.message = "retry budget exhausted after " + std::to_string(claimed.attempt_count) + " attempts: " + message;
    spdlog::error("chunk failed jobId={} index={} code={} err={}", job_id, index, to_string(code), cause.message);
    if (state_->fail_chunk(job_id, index, cause) == TransitionResult::kStoreError) {
      return HandlerOutcome::kRetry;
    }
    notify_if_failed(job_id);
    return HandlerOutcome::kAck;
  }

  spdlog::warn("chunk attempt failed jobId={} index={} attempt={}/{} code={} err={}", job_id, index,
               claimed.attempt_count, cfg_.max_attempts, to_string(code), message);
  const TransitionResult r = state_->release_chunk(job_id, index, cause);
  if (r == TransitionResult::kApplied || r == TransitionResult::kStoreError) {
    return HandlerOutcome::kRetry;
  }
  // Another attempt already settled the chunk.
  return HandlerOutcome::kAck;
}

HandlerOutcome ChunkHandler::commit(const std::string& job_id, int index, const ChunkRenderResult& rendered) {
  Liveness live = job_liveness(job_id);
  if (live == Liveness::kUnknown) {
    return HandlerOutcome::kRetry;
  }
  if (live == Liveness::kGone) {
    spdlog::info("chunk result discarded, job no longer live jobId={} index={}", job_id, index);
    return HandlerOutcome::kAck;
  }

  ChunkResult result;
  result.head_tracks = rendered.head_tracks;
  result.tail_tracks = rendered.tail_tracks;
  OpError err;
  bool stored = false;
  for (int attempt = 1; attempt <= cfg_.io_retry_attempts && !stored; ++attempt) {
    err = OpError{};
    stored = blobs_->put(job_id, rendered.output_bytes, result.output_ref, &err);
    if (!stored && attempt < cfg_.io_retry_attempts) {
      sleep_ms(backoff_ms(attempt, cfg_.io_backoff_base_ms, cfg_.io_backoff_max_ms));
    }
  }
  if (!stored) {
    Chunk chunk;
    const StoreStatus cs = state_->load_chunk(job_id, index, chunk);
    if (cs == StoreStatus::kError) return HandlerOutcome::kRetry;
    if (cs == StoreStatus::kNotFound) return HandlerOutcome::kAck;
    return on_failure(job_id, chunk, ErrorCode::kTransientIo, "chunk upload failed: " + err.message);
  }

  live = job_liveness(job_id);
  if (live == Liveness::kUnknown) {
    return HandlerOutcome::kRetry;
  }
  if (live == Liveness::kGone) {
    spdlog::info("chunk completion skipped, job no longer live jobId={} index={}", job_id, index);
    return HandlerOutcome::kAck;
  }

  const CompletionResult r = state_->increment_and_check_completion(job_id, index, &result);
  switch (r.result) {
    case TransitionResult::kStoreError:
      return HandlerOutcome::kRetry;
    case TransitionResult::kNotFound:
    case TransitionResult::kStale:
      return HandlerOutcome::kAck;
    case TransitionResult::kApplied:
      break;
  }
  if (r.trigger_stitch && !dispatcher_->enqueue_stitch(job_id)) {
    return HandlerOutcome::kRetry;
  }
  return HandlerOutcome::kAck;
}

HandlerOutcome ChunkHandler::handle(const Task& task, const TaskContext& ctx) {
  const std::string& job_id = task.job_id;
  if (!task.index.has_value()) {
    spdlog::error("chunk task without index jobId={}", job_id);
    return HandlerOutcome::kAck;
  }
  const int index = *task.index;

  Chunk chunk;
  const StoreStatus cs = state_->load_chunk(job_id, index, chunk);
  if (cs == StoreStatus::kError) {
    spdlog::warn("chunk record unreadable, retrying jobId={} index={}", job_id, index);
    return HandlerOutcome::kRetry;
  }
  if (cs == StoreStatus::kNotFound) {
    spdlog::warn("chunk task for unknown chunk jobId={} index={}", job_id, index);
    return HandlerOutcome::kAck;
  }
  if (chunk.status == ChunkStatus::kDone) {
    return settle_done(job_id, index);
  }

  Job job;
  const StoreStatus js = state_->load_job(job_id, job);
  if (js == StoreStatus::kError) {
    spdlog::warn("job record unreadable, retrying jobId={} index={}", job_id, index);
    return HandlerOutcome::kRetry;
  }
  if (js == StoreStatus::kNotFound || is_terminal(job.status)) {
    spdlog::info("chunk skipped jobId={} index={} jobStatus={}", job_id, index,
                 js == StoreStatus::kOk ? to_string(job.status) : "MISSING");
    return HandlerOutcome::kAck;
  }

  const ClaimResult claim = state_->claim_chunk(job_id, index, cfg_.max_attempts);
  switch (claim.outcome) {
    case ClaimOutcome::kClaimed:
      break;
    case ClaimOutcome::kDuplicate:
      spdlog::info("chunk already in flight, processing as duplicate jobId={} index={} attempt={}", job_id, index,
                   claim.chunk.attempt_count);
      break;
    case ClaimOutcome::kAlreadyDone:
      return settle_done(job_id, index);
    case ClaimOutcome::kAlreadyFailed:
    case ClaimOutcome::kNotFound:
      return HandlerOutcome::kAck;
    case ClaimOutcome::kStoreError:
      return HandlerOutcome::kRetry;
    case ClaimOutcome::kBudgetExhausted: {
      JobError cause;
      cause.code = claim.chunk.error.has_value() ? claim.chunk.error->code : ErrorCode::kModelInference;
      cause.message = "retry budget exhausted after " + std::to_string(claim.chunk.attempt_count) + " attempts" +
                      (claim.chunk.error.has_value() ? ": " + claim.chunk.error->message : std::string());
      if (state_->fail_chunk(job_id, index, cause) == TransitionResult::kStoreError) {
        return HandlerOutcome::kRetry;
      }
      notify_if_failed(job_id);
      return HandlerOutcome::kAck;
    }
  }

  const Chunk& claimed = claim.chunk;
  spdlog::info("chunk processing jobId={} index={} attempt={} span=[{:.2f},{:.2f})", job_id, index,
               claimed.attempt_count, claimed.span.start_s, claimed.span.end_s);

  OpError path_err;
  std::optional<std::string> input_path;
  for (int attempt = 1; attempt <= cfg_.io_retry_attempts; ++attempt) {
    path_err = OpError{};
    input_path = blobs_->local_path(claimed.input_ref, &path_err);
    if (input_path.has_value() || !is_retryable(path_err.code)) break;
    if (attempt < cfg_.io_retry_attempts) sleep_ms(backoff_ms(attempt, cfg_.io_backoff_base_ms, cfg_.io_backoff_max_ms));
  }
  if (!input_path.has_value()) {
    const ErrorCode code = is_retryable(path_err.code) ? path_err.code : ErrorCode::kCorruptInput;
    return on_failure(job_id, claimed, code, "input unavailable: " + path_err.message);
  }

  const ChunkRenderRequest request = make_request(job, claimed, *input_path, ctx);
  ChunkRenderResult rendered;
  ErrorCode code = ErrorCode::kInternal;
  std::string message;
  bool ok = false;
  for (int attempt = 1; attempt <= cfg_.io_retry_attempts; ++attempt) {
    try {
      rendered = pipeline_->render(request);
      ok = true;
      break;
    } catch (const ProcessingError& ex) {
      code = ex.code();
      message = ex.what();
    } catch (const std::exception& ex) {
      code = ErrorCode::kInternal;
      message = ex.what();
      break;
    }
    if (!is_retryable(code) || attempt == cfg_.io_retry_attempts) break;
    if (job_liveness(job_id) == Liveness::kGone) return HandlerOutcome::kAck;
    const auto delay = backoff_ms(attempt, cfg_.io_backoff_base_ms, cfg_.io_backoff_max_ms);
    spdlog::warn("chunk render retry jobId={} index={} try={} delayMs={} err={}", job_id, index, attempt, delay,
                 message);
    sleep_ms(delay);
  }
  if (!ok) {
    return on_failure(job_id, claimed, code, message);
  }
  return commit(job_id, index, rendered);
}

}  // namespace vscrub::sdk
