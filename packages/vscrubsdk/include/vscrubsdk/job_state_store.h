#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vscrubsdk/job_model.h"
#include "vscrubsdk/record_store.h"

namespace vscrub::sdk {

enum class TransitionResult : std::uint8_t {
  kApplied,
  kStale,  // persisted state did not match the expectation; callers treat it as a no-op
  kNotFound,
  kStoreError,
};

const char* to_string(TransitionResult result);

struct CompletionResult {
  TransitionResult result = TransitionResult::kStoreError;
  bool trigger_stitch = false;
  bool already_counted = false;
  int chunks_completed = 0;
  int chunk_count = 0;
};

enum class ClaimOutcome : std::uint8_t {
  kClaimed,
  kDuplicate,  // another attempt already holds PROCESSING; claimed anyway, not counted
  kAlreadyDone,
  kAlreadyFailed,
  kBudgetExhausted,
  kNotFound,
  kStoreError,
};

struct ClaimResult {
  ClaimOutcome outcome = ClaimOutcome::kStoreError;
  Chunk chunk;
};

struct NewJob {
  std::string input_ref;
  std::string profile = "NONE";
  nlohmann::json options = nlohmann::json::object();
  std::string notify_subject;
};

// Single source of truth for Job and Chunk records.
//
// Every mutation is an optimistic read-modify-write guarded by the record
// revision, retried on revision conflicts. Status preconditions are checked on
// the freshly read record, so a transition either applies against the exact
// state it expected or reports kStale.
class JobStateStore {
 public:
  explicit JobStateStore(RecordStore* store, int max_cas_retries = 64);

  std::optional<Job> create_job(const NewJob& request, OpError* err = nullptr);

  // nullopt when the record is missing or could not be read.
  std::optional<Job> get_job(const std::string& job_id) const;
  std::optional<Chunk> get_chunk(const std::string& job_id, int index) const;

  // Distinguish a missing record (kNotFound) from a failed read (kError).
  StoreStatus load_job(const std::string& job_id, Job& out) const;
  StoreStatus load_chunk(const std::string& job_id, int index, Chunk& out) const;

  // All chunk records of a job ordered by index. Empty when chunk_count is unset.
  std::vector<Chunk> list_chunks(const std::string& job_id) const;
  // As list_chunks; kError when the job or any chunk record could not be read.
  StoreStatus load_chunks(const std::string& job_id, std::vector<Chunk>& out) const;

  std::vector<std::string> list_job_ids() const;
  StoreStatus load_job_ids(std::vector<std::string>& out) const;

  TransitionResult transition_job(const std::string& job_id, JobStatus expected, JobStatus next,
                                  const std::optional<JobError>& error = std::nullopt);

  // Moves any non-terminal job to FAILED.
  TransitionResult fail_job(const std::string& job_id, const JobError& error);

  // Creates the chunk records (create-if-absent) and then sets chunk_count once.
  // kStale when chunk_count was already set; existing chunks are never re-created.
  TransitionResult create_chunks(const std::string& job_id, const std::vector<ChunkSpan>& spans, double duration_s);

  TransitionResult transition_chunk(const std::string& job_id, int index, ChunkStatus expected, ChunkStatus next,
                                    const std::optional<std::string>& result_ref = std::nullopt,
                                    const std::optional<JobError>& error = std::nullopt);

  // PENDING -> PROCESSING with attempt_count + 1, bounded by `max_attempts`.
  // A chunk already PROCESSING is reported as kDuplicate without spending an attempt.
  ClaimResult claim_chunk(const std::string& job_id, int index, int max_attempts);

  // Refreshes updated_at_ms of a PROCESSING chunk so stale sweeps leave it alone.
  TransitionResult touch_chunk(const std::string& job_id, int index);

  // Records the cause of a retryable failure and releases the chunk to PENDING.
  TransitionResult release_chunk(const std::string& job_id, int index, const JobError& error);

  // Marks the chunk FAILED and then the job FAILED with a cause naming the chunk.
  TransitionResult fail_chunk(const std::string& job_id, int index, const JobError& error);

  // Marks the chunk DONE with `result` (ignored when it is already DONE), counts it
  // once on the job and flips PROCESSING -> STITCHING when the last chunk lands.
  // Exactly one caller ever receives trigger_stitch = true.
  CompletionResult increment_and_check_completion(const std::string& job_id, int index,
                                                  const ChunkResult* result = nullptr);

  // STITCHING -> COMPLETED together with the artifact references.
  TransitionResult complete_job(const std::string& job_id, const std::string& output_ref,
                                const std::string& identity_map_ref);

  // FAILED -> STITCHING for a job whose chunks all completed. Operator action.
  TransitionResult reset_failed_stitch(const std::string& job_id);

  // Removes the job and chunk records.
  bool erase_job(const std::string& job_id);

 private:
  using JobMutator = std::function<TransitionResult(Job& job)>;
  using ChunkMutator = std::function<TransitionResult(Chunk& chunk)>;

  TransitionResult mutate_job(const std::string& job_id, const JobMutator& fn, Job* out = nullptr);
  TransitionResult mutate_chunk(const std::string& job_id, int index, const ChunkMutator& fn, Chunk* out = nullptr);

  bool read_job(const std::string& job_id, Job& out, std::uint64_t& rev, StoreStatus& status) const;
  bool read_chunk(const std::string& job_id, int index, Chunk& out, std::uint64_t& rev, StoreStatus& status) const;

  RecordStore* store_ = nullptr;
  int max_cas_retries_ = 64;
};

}  // namespace vscrub::sdk
