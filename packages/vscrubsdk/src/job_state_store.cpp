#include "vscrubsdk/job_state_store.h"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "vscrubsdk/msg_codec.h"
#include "vscrubsdk/naming.h"
#include "vscrubsdk/time_utils.h"

namespace vscrub::sdk {

using json = nlohmann::json;

const char* to_string(TransitionResult result) {
  switch (result) {
    case TransitionResult::kApplied:
      return "applied";
    case TransitionResult::kStale:
      return "stale";
    case TransitionResult::kNotFound:
      return "not_found";
    case TransitionResult::kStoreError:
      return "store_error";
  }
  return "store_error";
}

JobStateStore::JobStateStore(RecordStore* store, int max_cas_retries)
    : store_(store), max_cas_retries_(max_cas_retries > 0 ? max_cas_retries : 1) {
  if (store_ == nullptr) {
    throw std::invalid_argument("JobStateStore requires a record store");
  }
}

bool JobStateStore::read_job(const std::string& job_id, Job& out, std::uint64_t& rev, StoreStatus& status) const {
  VersionedValue v;
  status = store_->get(kv_key_job(job_id), v);
  if (status != StoreStatus::kOk) {
    return false;
  }
  json j;
  std::string err;
  if (!parse_json_bytes(v.bytes, j) || !job_from_json(j, out, err)) {
    spdlog::error("corrupt job record jobId={} err={}", job_id, err);
    status = StoreStatus::kError;
    return false;
  }
  rev = v.revision;
  return true;
}

bool JobStateStore::read_chunk(const std::string& job_id, int index, Chunk& out, std::uint64_t& rev,
                               StoreStatus& status) const {
  VersionedValue v;
  status = store_->get(kv_key_chunk(job_id, index), v);
  if (status != StoreStatus::kOk) {
    return false;
  }
  json j;
  std::string err;
  if (!parse_json_bytes(v.bytes, j) || !chunk_from_json(j, out, err)) {
    spdlog::error("corrupt chunk record jobId={} index={} err={}", job_id, index, err);
    status = StoreStatus::kError;
    return false;
  }
  rev = v.revision;
  return true;
}

TransitionResult JobStateStore::mutate_job(const std::string& job_id, const JobMutator& fn, Job* out) {
  for (int attempt = 0; attempt < max_cas_retries_; ++attempt) {
    Job job;
    std::uint64_t rev = 0;
    StoreStatus st = StoreStatus::kError;
    if (!read_job(job_id, job, rev, st)) {
      return st == StoreStatus::kNotFound ? TransitionResult::kNotFound : TransitionResult::kStoreError;
    }
    const TransitionResult r = fn(job);
    if (r != TransitionResult::kApplied) {
      if (out != nullptr) *out = job;
      return r;
    }
    job.updated_at_ms = now_ms();
    const StoreStatus ws = store_->update(kv_key_job(job_id), dump_json_bytes(job_to_json(job)), rev);
    if (ws == StoreStatus::kOk) {
      if (out != nullptr) *out = job;
      return TransitionResult::kApplied;
    }
    if (ws == StoreStatus::kConflict) {
      continue;  // lost a race; re-read and re-evaluate
    }
    return ws == StoreStatus::kNotFound ? TransitionResult::kNotFound : TransitionResult::kStoreError;
  }
  spdlog::warn("job CAS retries exhausted jobId={}", job_id);
  return TransitionResult::kStoreError;
}

TransitionResult JobStateStore::mutate_chunk(const std::string& job_id, int index, const ChunkMutator& fn,
                                             Chunk* out) {
  for (int attempt = 0; attempt < max_cas_retries_; ++attempt) {
    Chunk chunk;
    std::uint64_t rev = 0;
    StoreStatus st = StoreStatus::kError;
    if (!read_chunk(job_id, index, chunk, rev, st)) {
      return st == StoreStatus::kNotFound ? TransitionResult::kNotFound : TransitionResult::kStoreError;
    }
    const TransitionResult r = fn(chunk);
    if (r != TransitionResult::kApplied) {
      if (out != nullptr) *out = chunk;
      return r;
    }
    chunk.updated_at_ms = now_ms();
    const StoreStatus ws = store_->update(kv_key_chunk(job_id, index), dump_json_bytes(chunk_to_json(chunk)), rev);
    if (ws == StoreStatus::kOk) {
      if (out != nullptr) *out = chunk;
      return TransitionResult::kApplied;
    }
    if (ws == StoreStatus::kConflict) {
      continue;
    }
    return ws == StoreStatus::kNotFound ? TransitionResult::kNotFound : TransitionResult::kStoreError;
  }
  spdlog::warn("chunk CAS retries exhausted jobId={} index={}", job_id, index);
  return TransitionResult::kStoreError;
}

std::optional<Job> JobStateStore::create_job(const NewJob& request, OpError* err) {
  if (request.input_ref.empty()) {
    set_error(err, ErrorCode::kInvalidArgument, "input_ref must be non-empty");
    return std::nullopt;
  }
  Job job;
  job.status = JobStatus::kQueued;
  job.input_ref = request.input_ref;
  job.profile = request.profile.empty() ? std::string("NONE") : request.profile;
  job.options = request.options.is_object() ? request.options : json::object();
  job.notify_subject = request.notify_subject;
  job.created_at_ms = now_ms();
  job.updated_at_ms = job.created_at_ms;

  for (int attempt = 0; attempt < 4; ++attempt) {
    job.job_id = make_job_id();
    const StoreStatus s = store_->create(kv_key_job(job.job_id), dump_json_bytes(job_to_json(job)));
    if (s == StoreStatus::kOk) {
      spdlog::info("job created jobId={} inputRef={} profile={}", job.job_id, job.input_ref, job.profile);
      return job;
    }
    if (s != StoreStatus::kConflict) {
      set_error(err, ErrorCode::kTransientIo, std::string("record store create failed: ") + to_string(s));
      return std::nullopt;
    }
  }
  set_error(err, ErrorCode::kInternal, "could not allocate a unique job id");
  return std::nullopt;
}

std::optional<Job> JobStateStore::get_job(const std::string& job_id) const {
  Job job;
  if (load_job(job_id, job) != StoreStatus::kOk) {
    return std::nullopt;
  }
  return job;
}

std::optional<Chunk> JobStateStore::get_chunk(const std::string& job_id, int index) const {
  Chunk chunk;
  if (load_chunk(job_id, index, chunk) != StoreStatus::kOk) {
    return std::nullopt;
  }
  return chunk;
}

StoreStatus JobStateStore::load_job(const std::string& job_id, Job& out) const {
  std::uint64_t rev = 0;
  StoreStatus st = StoreStatus::kError;
  read_job(job_id, out, rev, st);
  return st;
}

StoreStatus JobStateStore::load_chunk(const std::string& job_id, int index, Chunk& out) const {
  std::uint64_t rev = 0;
  StoreStatus st = StoreStatus::kError;
  read_chunk(job_id, index, out, rev, st);
  return st;
}

std::vector<Chunk> JobStateStore::list_chunks(const std::string& job_id) const {
  std::vector<Chunk> out;
  if (load_chunks(job_id, out) == StoreStatus::kError) {
    spdlog::warn("chunk listing incomplete jobId={}", job_id);
  }
  return out;
}

StoreStatus JobStateStore::load_chunks(const std::string& job_id, std::vector<Chunk>& out) const {
  out.clear();
  Job job;
  const StoreStatus js = load_job(job_id, job);
  if (js != StoreStatus::kOk) {
    return js;
  }
  if (!job.chunk_count.has_value()) {
    return StoreStatus::kOk;
  }
  out.reserve(static_cast<std::size_t>(*job.chunk_count));
  for (int i = 0; i < *job.chunk_count; ++i) {
    Chunk chunk;
    const StoreStatus cs = load_chunk(job_id, i, chunk);
    if (cs == StoreStatus::kNotFound) {
      spdlog::warn("missing chunk record jobId={} index={}", job_id, i);
      continue;
    }
    if (cs != StoreStatus::kOk) {
      return StoreStatus::kError;
    }
    out.push_back(std::move(chunk));
  }
  return StoreStatus::kOk;
}

std::vector<std::string> JobStateStore::list_job_ids() const {
  std::vector<std::string> ids;
  load_job_ids(ids);
  return ids;
}

StoreStatus JobStateStore::load_job_ids(std::vector<std::string>& out) const {
  out.clear();
  std::vector<std::string> keys;
  const StoreStatus s = store_->list_keys(kv_prefix_jobs(), keys);
  if (s != StoreStatus::kOk) {
    return s;
  }
  for (const auto& key : keys) {
    auto id = job_id_from_key(key);
    if (!id.empty()) out.push_back(std::move(id));
  }
  std::sort(out.begin(), out.end());
  return StoreStatus::kOk;
}

TransitionResult JobStateStore::transition_job(const std::string& job_id, JobStatus expected, JobStatus next,
                                               const std::optional<JobError>& error) {
  if (!job_transition_allowed(expected, next)) {
    throw std::invalid_argument(std::string("illegal job transition ") + to_string(expected) + " -> " +
                                to_string(next));
  }
  const TransitionResult r = mutate_job(job_id, [&](Job& job) {
    if (job.status != expected) {
      return TransitionResult::kStale;
    }
    job.status = next;
    if (error.has_value()) {
      job.error = error;
    }
    return TransitionResult::kApplied;
  });
  if (r == TransitionResult::kApplied) {
    spdlog::info("job transition jobId={} {} -> {}", job_id, to_string(expected), to_string(next));
  } else if (r == TransitionResult::kStale) {
    spdlog::debug("stale job transition jobId={} expected={} next={}", job_id, to_string(expected), to_string(next));
  }
  return r;
}

TransitionResult JobStateStore::fail_job(const std::string& job_id, const JobError& error) {
  JobStatus from = JobStatus::kFailed;
  const TransitionResult r = mutate_job(job_id, [&](Job& job) {
    if (is_terminal(job.status)) {
      return TransitionResult::kStale;
    }
    from = job.status;
    job.status = JobStatus::kFailed;
    job.error = error;
    return TransitionResult::kApplied;
  });
  if (r == TransitionResult::kApplied) {
    spdlog::warn("job failed jobId={} from={} code={} msg={}", job_id, to_string(from), to_string(error.code),
                 error.message);
  }
  return r;
}

TransitionResult JobStateStore::create_chunks(const std::string& job_id, const std::vector<ChunkSpan>& spans,
                                              double duration_s) {
  if (spans.empty()) {
    throw std::invalid_argument("create_chunks requires at least one span");
  }
  for (std::size_t i = 0; i < spans.size(); ++i) {
    if (spans[i].index != static_cast<int>(i)) {
      throw std::invalid_argument("chunk spans must be indexed 0..n-1 in order");
    }
  }

  Job job;
  const StoreStatus js = load_job(job_id, job);
  if (js != StoreStatus::kOk) {
    return js == StoreStatus::kNotFound ? TransitionResult::kNotFound : TransitionResult::kStoreError;
  }
  if (job.chunk_count.has_value()) {
    return TransitionResult::kStale;
  }

  for (const auto& span : spans) {
    Chunk chunk;
    chunk.job_id = job_id;
    chunk.index = span.index;
    chunk.status = ChunkStatus::kPending;
    chunk.input_ref = job.input_ref;
    chunk.span = span;
    chunk.updated_at_ms = now_ms();
    const StoreStatus s = store_->create(kv_key_chunk(job_id, span.index), dump_json_bytes(chunk_to_json(chunk)));
    if (s == StoreStatus::kConflict) {
      continue;  // left behind by an earlier delivery of the same INGEST task
    }
    if (s != StoreStatus::kOk) {
      spdlog::warn("chunk create failed jobId={} index={} status={}", job_id, span.index, to_string(s));
      return TransitionResult::kStoreError;
    }
  }

  const int count = static_cast<int>(spans.size());
  const TransitionResult r = mutate_job(job_id, [&](Job& j) {
    if (j.chunk_count.has_value() || j.status != JobStatus::kChunking) {
      return TransitionResult::kStale;
    }
    j.chunk_count = count;
    j.duration_s = duration_s;
    return TransitionResult::kApplied;
  });
  if (r == TransitionResult::kApplied) {
    spdlog::info("chunks created jobId={} chunkCount={} durationS={:.3f}", job_id, count, duration_s);
  }
  return r;
}

TransitionResult JobStateStore::transition_chunk(const std::string& job_id, int index, ChunkStatus expected,
                                                 ChunkStatus next, const std::optional<std::string>& result_ref,
                                                 const std::optional<JobError>& error) {
  if (!chunk_transition_allowed(expected, next)) {
    throw std::invalid_argument(std::string("illegal chunk transition ") + to_string(expected) + " -> " +
                                to_string(next));
  }
  return mutate_chunk(job_id, index, [&](Chunk& chunk) {
    if (chunk.status != expected) {
      return TransitionResult::kStale;
    }
    chunk.status = next;
    if (result_ref.has_value()) {
      chunk.output_ref = *result_ref;
    }
    if (error.has_value()) {
      chunk.error = error;
    }
    return TransitionResult::kApplied;
  });
}

ClaimResult JobStateStore::claim_chunk(const std::string& job_id, int index, int max_attempts) {
  ClaimResult out;
  ClaimOutcome outcome = ClaimOutcome::kStoreError;
  const TransitionResult r = mutate_chunk(
      job_id, index,
      [&](Chunk& chunk) {
        switch (chunk.status) {
          case ChunkStatus::kDone:
            outcome = ClaimOutcome::kAlreadyDone;
            return TransitionResult::kStale;
          case ChunkStatus::kFailed:
            outcome = ClaimOutcome::kAlreadyFailed;
            return TransitionResult::kStale;
          default:
            break;
        }
        if (chunk.status == ChunkStatus::kProcessing) {
          // Redelivery while an attempt is in flight; the attempt already counted.
          outcome = ClaimOutcome::kDuplicate;
          return TransitionResult::kStale;
        }
        if (max_attempts > 0 && chunk.attempt_count >= max_attempts) {
          outcome = ClaimOutcome::kBudgetExhausted;
          return TransitionResult::kStale;
        }
        outcome = ClaimOutcome::kClaimed;
        chunk.status = ChunkStatus::kProcessing;
        chunk.attempt_count += 1;
        return TransitionResult::kApplied;
      },
      &out.chunk);
  if (r == TransitionResult::kNotFound) {
    out.outcome = ClaimOutcome::kNotFound;
  } else if (r == TransitionResult::kStoreError) {
    out.outcome = ClaimOutcome::kStoreError;
  } else {
    out.outcome = outcome;
  }
  return out;
}

TransitionResult JobStateStore::touch_chunk(const std::string& job_id, int index) {
  return mutate_chunk(job_id, index, [](Chunk& chunk) {
    return chunk.status == ChunkStatus::kProcessing ? TransitionResult::kApplied : TransitionResult::kStale;
  });
}

TransitionResult JobStateStore::release_chunk(const std::string& job_id, int index, const JobError& error) {
  return mutate_chunk(job_id, index, [&](Chunk& chunk) {
    if (chunk.status != ChunkStatus::kProcessing) {
      return TransitionResult::kStale;
    }
    chunk.status = ChunkStatus::kPending;
    chunk.error = error;
    return TransitionResult::kApplied;
  });
}

TransitionResult JobStateStore::fail_chunk(const std::string& job_id, int index, const JobError& error) {
  JobError cause = error;
  cause.chunk_index = index;
  const TransitionResult r = mutate_chunk(job_id, index, [&](Chunk& chunk) {
    if (chunk.status == ChunkStatus::kDone || chunk.status == ChunkStatus::kFailed) {
      return TransitionResult::kStale;
    }
    chunk.status = ChunkStatus::kFailed;
    chunk.error = cause;
    return TransitionResult::kApplied;
  });
  if (r == TransitionResult::kNotFound || r == TransitionResult::kStoreError) {
    return r;
  }
  // A single failed chunk fails the whole job, also when the chunk was failed earlier.
  Chunk chunk;
  const StoreStatus cs = load_chunk(job_id, index, chunk);
  if (cs == StoreStatus::kError) {
    return TransitionResult::kStoreError;
  }
  if (cs == StoreStatus::kOk && chunk.status == ChunkStatus::kFailed) {
    JobError job_error = chunk.error.value_or(cause);
    job_error.chunk_index = index;
    job_error.message = "chunk " + std::to_string(index) + ": " + job_error.message;
    const TransitionResult jr = fail_job(job_id, job_error);
    if (jr == TransitionResult::kStoreError) {
      return jr;
    }
  }
  return r;
}

CompletionResult JobStateStore::increment_and_check_completion(const std::string& job_id, int index,
                                                               const ChunkResult* result) {
  CompletionResult out;

  bool chunk_failed = false;
  const TransitionResult cr = mutate_chunk(job_id, index, [&](Chunk& chunk) {
    if (chunk.status == ChunkStatus::kDone) {
      return TransitionResult::kStale;  // keep the result of the attempt that finished first
    }
    if (chunk.status == ChunkStatus::kFailed) {
      chunk_failed = true;
      return TransitionResult::kStale;
    }
    if (result == nullptr) {
      chunk_failed = true;
      return TransitionResult::kStale;
    }
    chunk.status = ChunkStatus::kDone;
    chunk.output_ref = result->output_ref;
    chunk.head_tracks = result->head_tracks;
    chunk.boundary_tracks = result->tail_tracks;
    chunk.error.reset();
    return TransitionResult::kApplied;
  });
  if (cr == TransitionResult::kNotFound || cr == TransitionResult::kStoreError) {
    out.result = cr;
    return out;
  }
  if (chunk_failed) {
    out.result = TransitionResult::kStale;
    return out;
  }

  bool counted_before = false;
  bool flipped = false;
  Job job;
  const TransitionResult jr = mutate_job(
      job_id,
      [&](Job& j) {
        counted_before = false;
        flipped = false;
        if (!j.chunk_count.has_value() || index < 0 || index >= *j.chunk_count) {
          return TransitionResult::kStale;
        }
        if (std::binary_search(j.completed_indices.begin(), j.completed_indices.end(), index)) {
          counted_before = true;
          return TransitionResult::kStale;
        }
        if (is_terminal(j.status)) {
          return TransitionResult::kStale;
        }
        j.completed_indices.insert(std::upper_bound(j.completed_indices.begin(), j.completed_indices.end(), index),
                                   index);
        j.chunks_completed = static_cast<int>(j.completed_indices.size());
        if (j.chunks_completed == *j.chunk_count && j.status == JobStatus::kProcessing) {
          j.status = JobStatus::kStitching;
          flipped = true;
        }
        return TransitionResult::kApplied;
      },
      &job);

  out.chunks_completed = job.chunks_completed;
  out.chunk_count = job.chunk_count.value_or(0);
  if (jr == TransitionResult::kApplied) {
    out.result = TransitionResult::kApplied;
    out.trigger_stitch = flipped;
    spdlog::info("chunk completed jobId={} index={} progress={}/{}{}", job_id, index, out.chunks_completed,
                 out.chunk_count, flipped ? " -> STITCHING" : "");
    return out;
  }
  if (jr == TransitionResult::kStale && counted_before) {
    out.result = TransitionResult::kApplied;
    out.already_counted = true;
    return out;
  }
  out.result = jr;
  return out;
}

TransitionResult JobStateStore::complete_job(const std::string& job_id, const std::string& output_ref,
                                             const std::string& identity_map_ref) {
  const TransitionResult r = mutate_job(job_id, [&](Job& job) {
    if (job.status != JobStatus::kStitching) {
      return TransitionResult::kStale;
    }
    job.status = JobStatus::kCompleted;
    job.output_ref = output_ref;
    job.identity_map_ref = identity_map_ref;
    job.error.reset();
    return TransitionResult::kApplied;
  });
  if (r == TransitionResult::kApplied) {
    spdlog::info("job completed jobId={} outputRef={}", job_id, output_ref);
  }
  return r;
}

TransitionResult JobStateStore::reset_failed_stitch(const std::string& job_id) {
  return mutate_job(job_id, [&](Job& job) {
    if (job.status != JobStatus::kFailed || !job.chunk_count.has_value() ||
        job.chunks_completed != *job.chunk_count) {
      return TransitionResult::kStale;
    }
    if (job.error.has_value() && job.error->code == ErrorCode::kCancelled) {
      return TransitionResult::kStale;
    }
    job.status = JobStatus::kStitching;
    job.error.reset();
    job.output_ref.clear();
    return TransitionResult::kApplied;
  });
}

bool JobStateStore::erase_job(const std::string& job_id) {
  std::vector<std::string> keys;
  if (store_->list_keys(kv_prefix_chunks(job_id), keys) != StoreStatus::kOk) {
    return false;
  }
  bool ok = true;
  for (const auto& key : keys) {
    const StoreStatus s = store_->remove(key);
    ok = ok && (s == StoreStatus::kOk || s == StoreStatus::kNotFound);
  }
  const StoreStatus s = store_->remove(kv_key_job(job_id));
  return ok && (s == StoreStatus::kOk || s == StoreStatus::kNotFound);
}

}  // namespace vscrub::sdk
