#include "vscrubsdk/stitch_coordinator.h"

#include <exception>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "vscrubsdk/msg_codec.h"
#include "vscrubsdk/time_utils.h"

namespace vscrub::sdk {

StitchCoordinator::StitchCoordinator(Config cfg, JobStateStore* state, BlobStore* blobs,
                                     VideoConcatenator* concatenator, JobNotifier* notifier)
    : cfg_(cfg),
      state_(state),
      blobs_(blobs),
      concatenator_(concatenator),
      notifier_(notifier),
      resolver_(cfg.tau) {
  if (state_ == nullptr || blobs_ == nullptr || concatenator_ == nullptr) {
    throw std::invalid_argument("StitchCoordinator requires state, blobs and concatenator");
  }
}

bool StitchCoordinator::put_with_retry(const std::string& job_id, const std::vector<std::uint8_t>& bytes,
                                       std::string& ref, OpError& err) {
  for (int attempt = 1; attempt <= cfg_.io_retry_attempts; ++attempt) {
    err = OpError{};
    if (blobs_->put(job_id, bytes, ref, &err)) return true;
    if (!is_retryable(err.code)) return false;
    if (attempt < cfg_.io_retry_attempts) sleep_ms(backoff_ms(attempt, cfg_.io_backoff_base_ms, cfg_.io_backoff_max_ms));
  }
  return false;
}

HandlerOutcome StitchCoordinator::fail(const std::string& job_id, ErrorCode code, const std::string& message) {
  JobError cause;
  cause.code = code;
  cause.message = "stitch: " + message;
  const TransitionResult r = state_->transition_job(job_id, JobStatus::kStitching, JobStatus::kFailed, cause);
  if (r == TransitionResult::kStoreError) {
    return HandlerOutcome::kRetry;
  }
  if (r == TransitionResult::kApplied) {
    spdlog::error("stitch failed jobId={} code={} err={}", job_id, to_string(code), message);
    if (notifier_ != nullptr) {
      if (auto job = state_->get_job(job_id)) notifier_->job_finished(*job);
    }
  }
  return HandlerOutcome::kAck;
}

HandlerOutcome StitchCoordinator::handle(const Task& task, const TaskContext& ctx) {
  const std::string& job_id = task.job_id;
  Job job;
  const StoreStatus js = state_->load_job(job_id, job);
  if (js == StoreStatus::kError) {
    spdlog::warn("job record unreadable, retrying stitch jobId={}", job_id);
    return HandlerOutcome::kRetry;
  }
  if (js == StoreStatus::kNotFound) {
    spdlog::warn("stitch for unknown job jobId={}", job_id);
    return HandlerOutcome::kAck;
  }
  if (job.status != JobStatus::kStitching) {
    spdlog::info("stitch no-op jobId={} status={}", job_id, to_string(job.status));
    return HandlerOutcome::kAck;
  }

  const int count = job.chunk_count.value_or(0);
  std::vector<Chunk> chunks;
  if (state_->load_chunks(job_id, chunks) == StoreStatus::kError) {
    spdlog::warn("chunk records unreadable, retrying stitch jobId={}", job_id);
    return HandlerOutcome::kRetry;
  }
  if (count <= 0 || static_cast<int>(chunks.size()) != count) {
    return fail(job_id, ErrorCode::kInternal,
                "expected " + std::to_string(count) + " chunk records, found " + std::to_string(chunks.size()));
  }

  std::vector<std::string> paths;
  paths.reserve(chunks.size());
  for (const auto& c : chunks) {
    if (c.status != ChunkStatus::kDone || c.output_ref.empty()) {
      return fail(job_id, ErrorCode::kInternal, "chunk " + std::to_string(c.index) + " has no output");
    }
    OpError err;
    std::optional<std::string> path;
    for (int attempt = 1; attempt <= cfg_.io_retry_attempts; ++attempt) {
      err = OpError{};
      path = blobs_->local_path(c.output_ref, &err);
      if (path.has_value() || !is_retryable(err.code)) break;
      if (attempt < cfg_.io_retry_attempts) sleep_ms(backoff_ms(attempt, cfg_.io_backoff_base_ms, cfg_.io_backoff_max_ms));
    }
    if (!path.has_value()) {
      return fail(job_id, err.code, "chunk " + std::to_string(c.index) + " output unavailable: " + err.message);
    }
    paths.push_back(*path);
  }

  const GlobalIdentityMap identities = resolver_.resolve(chunks);
  spdlog::info("identities resolved jobId={} tracks={} identities={} seamMatches={}", job_id,
               identities.entries().size(), identities.identity_count(), identities.matches().size());

  if (ctx.keepalive) ctx.keepalive();
  const std::function<void()> keepalive = ctx.keepalive ? ctx.keepalive : [] {};
  std::vector<std::uint8_t> artifact;
  try {
    artifact = concatenator_->concatenate(paths, keepalive);
  } catch (const ProcessingError& ex) {
    return fail(job_id, ex.code(), ex.what());
  } catch (const std::exception& ex) {
    return fail(job_id, ErrorCode::kInternal, ex.what());
  }
  if (artifact.empty()) {
    return fail(job_id, ErrorCode::kInternal, "concatenation produced no output");
  }

  OpError err;
  std::string output_ref;
  if (!put_with_retry(job_id, artifact, output_ref, err)) {
    return fail(job_id, err.code, "artifact upload failed: " + err.message);
  }
  nlohmann::json map_doc = identities.to_json();
  map_doc["jobId"] = job_id;
  map_doc["tau"] = resolver_.tau();
  std::string identity_ref;
  if (!put_with_retry(job_id, dump_json_bytes(map_doc), identity_ref, err)) {
    return fail(job_id, err.code, "identity map upload failed: " + err.message);
  }

  const TransitionResult r = state_->complete_job(job_id, output_ref, identity_ref);
  switch (r) {
    case TransitionResult::kApplied:
      if (notifier_ != nullptr) {
        if (auto done = state_->get_job(job_id)) notifier_->job_finished(*done);
      }
      return HandlerOutcome::kAck;
    case TransitionResult::kStoreError:
      return HandlerOutcome::kRetry;
    case TransitionResult::kStale:
    case TransitionResult::kNotFound:
      spdlog::info("stitch result not applied jobId={} result={}", job_id, to_string(r));
      return HandlerOutcome::kAck;
  }
  return HandlerOutcome::kAck;
}

}  // namespace vscrub::sdk
