#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "test_support.h"
#include "vscrubsdk/ingestion_coordinator.h"
#include "vscrubsdk/job_state_store.h"
#include "vscrubsdk/memory_record_store.h"
#include "vscrubsdk/msg_codec.h"
#include "vscrubsdk/naming.h"

using namespace vscrub::sdk;

namespace {

// Job in PROCESSING with `n` PENDING chunks.
std::string make_processing_job(JobStateStore& state, int n) {
  NewJob req;
  req.input_ref = "blob:input";
  auto job = state.create_job(req);
  EXPECT_TRUE(job.has_value());
  EXPECT_EQ(state.transition_job(job->job_id, JobStatus::kQueued, JobStatus::kChunking), TransitionResult::kApplied);
  const auto spans = IngestionCoordinator::plan_chunks(10.0 * n, 10.0, 1.0);
  EXPECT_EQ(state.create_chunks(job->job_id, spans, 10.0 * n), TransitionResult::kApplied);
  EXPECT_EQ(state.transition_job(job->job_id, JobStatus::kChunking, JobStatus::kProcessing),
            TransitionResult::kApplied);
  return job->job_id;
}

ChunkResult result_for(int index) {
  ChunkResult r;
  r.output_ref = "blob:out-" + std::to_string(index);
  return r;
}

}  // namespace

TEST(MemoryRecordStore, CreateAndUpdateAreCompareAndSet) {
  MemoryRecordStore store;
  std::uint64_t rev = 0;
  ASSERT_EQ(store.create("jobs.a", {1}, &rev), StoreStatus::kOk);
  EXPECT_EQ(store.create("jobs.a", {2}), StoreStatus::kConflict);

  std::uint64_t rev2 = 0;
  EXPECT_EQ(store.update("jobs.a", {3}, rev, &rev2), StoreStatus::kOk);
  EXPECT_GT(rev2, rev);
  EXPECT_EQ(store.update("jobs.a", {4}, rev), StoreStatus::kConflict);
  EXPECT_EQ(store.update("jobs.missing", {4}, 1), StoreStatus::kNotFound);

  VersionedValue v;
  ASSERT_EQ(store.get("jobs.a", v), StoreStatus::kOk);
  EXPECT_EQ(v.bytes, std::vector<std::uint8_t>{3});
  EXPECT_EQ(v.revision, rev2);
}

TEST(JobStateStore, CreateJobStartsQueued) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  NewJob req;
  req.input_ref = "blob:input";
  req.profile = "GDPR";
  const auto job = state.create_job(req);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status, JobStatus::kQueued);
  EXPECT_FALSE(job->chunk_count.has_value());

  const auto loaded = state.get_job(job->job_id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->profile, "GDPR");
  EXPECT_EQ(loaded->input_ref, "blob:input");

  OpError err;
  EXPECT_FALSE(state.create_job(NewJob{}, &err).has_value());
  EXPECT_EQ(err.code, ErrorCode::kInvalidArgument);
}

TEST(JobStateStore, StaleTransitionIsNoOp) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  NewJob req;
  req.input_ref = "blob:input";
  const auto job = state.create_job(req);
  ASSERT_TRUE(job.has_value());

  EXPECT_EQ(state.transition_job(job->job_id, JobStatus::kQueued, JobStatus::kChunking), TransitionResult::kApplied);
  // Second worker still believes the job is QUEUED.
  EXPECT_EQ(state.transition_job(job->job_id, JobStatus::kQueued, JobStatus::kChunking), TransitionResult::kStale);
  EXPECT_EQ(state.get_job(job->job_id)->status, JobStatus::kChunking);

  EXPECT_EQ(state.transition_job("job-missing", JobStatus::kQueued, JobStatus::kChunking),
            TransitionResult::kNotFound);
  EXPECT_THROW(state.transition_job(job->job_id, JobStatus::kChunking, JobStatus::kCompleted), std::invalid_argument);
}

TEST(JobStateStore, TerminalJobsNeverMove) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  const std::string id = make_processing_job(state, 2);

  JobError cancelled{ErrorCode::kCancelled, "cancelled by request", std::nullopt};
  EXPECT_EQ(state.fail_job(id, cancelled), TransitionResult::kApplied);
  EXPECT_EQ(state.fail_job(id, JobError{ErrorCode::kInternal, "later", std::nullopt}), TransitionResult::kStale);

  const auto job = state.get_job(id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status, JobStatus::kFailed);
  ASSERT_TRUE(job->error.has_value());
  EXPECT_EQ(job->error->code, ErrorCode::kCancelled);

  // Completing a chunk of a failed job records the chunk but never counts it.
  const auto result = result_for(0);
  const CompletionResult c = state.increment_and_check_completion(id, 0, &result);
  EXPECT_EQ(c.result, TransitionResult::kStale);
  EXPECT_FALSE(c.trigger_stitch);
  EXPECT_EQ(state.get_job(id)->chunks_completed, 0);
}

TEST(JobStateStore, CreateChunksOnce) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  NewJob req;
  req.input_ref = "blob:input";
  const auto job = state.create_job(req);
  ASSERT_TRUE(job.has_value());
  ASSERT_EQ(state.transition_job(job->job_id, JobStatus::kQueued, JobStatus::kChunking), TransitionResult::kApplied);

  const auto spans = IngestionCoordinator::plan_chunks(125.0, 60.0, 5.0);
  EXPECT_EQ(state.create_chunks(job->job_id, spans, 125.0), TransitionResult::kApplied);
  EXPECT_EQ(state.create_chunks(job->job_id, spans, 125.0), TransitionResult::kStale);

  const auto loaded = state.get_job(job->job_id);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_TRUE(loaded->chunk_count.has_value());
  EXPECT_EQ(*loaded->chunk_count, 3);
  EXPECT_DOUBLE_EQ(loaded->duration_s, 125.0);

  const auto chunks = state.list_chunks(job->job_id);
  ASSERT_EQ(chunks.size(), 3u);
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(chunks[i].index, i);
    EXPECT_EQ(chunks[i].status, ChunkStatus::kPending);
    EXPECT_EQ(chunks[i].input_ref, "blob:input");
  }
}

TEST(JobStateStore, ClaimCountsAttemptsAndStopsAtBudget) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  const std::string id = make_processing_job(state, 1);
  const JobError cause{ErrorCode::kTransientIo, "disk hiccup", 0};

  ClaimResult c1 = state.claim_chunk(id, 0, 2);
  EXPECT_EQ(c1.outcome, ClaimOutcome::kClaimed);
  EXPECT_EQ(c1.chunk.attempt_count, 1);

  // A duplicate delivery while the first attempt still holds the chunk.
  ClaimResult c2 = state.claim_chunk(id, 0, 2);
  EXPECT_EQ(c2.outcome, ClaimOutcome::kDuplicate);
  EXPECT_EQ(c2.chunk.attempt_count, 1);
  EXPECT_EQ(c2.chunk.status, ChunkStatus::kProcessing);

  ASSERT_EQ(state.release_chunk(id, 0, cause), TransitionResult::kApplied);
  ClaimResult c3 = state.claim_chunk(id, 0, 2);
  EXPECT_EQ(c3.outcome, ClaimOutcome::kClaimed);
  EXPECT_EQ(c3.chunk.attempt_count, 2);

  ASSERT_EQ(state.release_chunk(id, 0, cause), TransitionResult::kApplied);
  ClaimResult c4 = state.claim_chunk(id, 0, 2);
  EXPECT_EQ(c4.outcome, ClaimOutcome::kBudgetExhausted);
  EXPECT_EQ(c4.chunk.attempt_count, 2);

  EXPECT_EQ(state.claim_chunk(id, 7, 2).outcome, ClaimOutcome::kNotFound);
}

TEST(JobStateStore, DuplicateClaimsNeverExhaustTheBudget) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  const std::string id = make_processing_job(state, 1);

  ASSERT_EQ(state.claim_chunk(id, 0, 3).outcome, ClaimOutcome::kClaimed);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(state.claim_chunk(id, 0, 3).outcome, ClaimOutcome::kDuplicate);
  }
  EXPECT_EQ(state.get_chunk(id, 0)->attempt_count, 1);
  EXPECT_EQ(state.get_job(id)->status, JobStatus::kProcessing);
}

TEST(JobStateStore, TouchRefreshesOnlyProcessingChunks) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  const std::string id = make_processing_job(state, 2);

  EXPECT_EQ(state.touch_chunk(id, 0), TransitionResult::kStale);
  ASSERT_EQ(state.claim_chunk(id, 0, 3).outcome, ClaimOutcome::kClaimed);
  const std::int64_t claimed_at = state.get_chunk(id, 0)->updated_at_ms;
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  EXPECT_EQ(state.touch_chunk(id, 0), TransitionResult::kApplied);
  EXPECT_GT(state.get_chunk(id, 0)->updated_at_ms, claimed_at);
  EXPECT_EQ(state.get_chunk(id, 0)->attempt_count, 1);
  EXPECT_EQ(state.touch_chunk(id, 9), TransitionResult::kNotFound);
}

TEST(JobStateStore, LoadSeparatesMissingFromUnreadable) {
  MemoryRecordStore records;
  vscrub::test::FlakyRecordStore flaky(&records);
  JobStateStore state(&flaky);
  const std::string id = make_processing_job(state, 2);

  Job job;
  EXPECT_EQ(state.load_job(id, job), StoreStatus::kOk);
  EXPECT_EQ(state.load_job("job-missing", job), StoreStatus::kNotFound);
  flaky.fail_gets("jobs.", 1);
  EXPECT_EQ(state.load_job(id, job), StoreStatus::kError);

  Chunk chunk;
  flaky.fail_gets("chunks.", 1);
  EXPECT_EQ(state.load_chunk(id, 1, chunk), StoreStatus::kError);
  EXPECT_EQ(state.load_chunk(id, 1, chunk), StoreStatus::kOk);

  std::vector<Chunk> chunks;
  flaky.fail_gets("chunks.", 1);
  EXPECT_EQ(state.load_chunks(id, chunks), StoreStatus::kError);
  EXPECT_EQ(state.load_chunks(id, chunks), StoreStatus::kOk);
  EXPECT_EQ(chunks.size(), 2u);

  std::vector<std::string> ids;
  flaky.fail_lists(1);
  EXPECT_EQ(state.load_job_ids(ids), StoreStatus::kError);
  EXPECT_EQ(state.load_job_ids(ids), StoreStatus::kOk);
  EXPECT_EQ(ids, std::vector<std::string>{id});
}

TEST(JobStateStore, ReleaseReturnsChunkToPending) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  const std::string id = make_processing_job(state, 1);

  ASSERT_EQ(state.claim_chunk(id, 0, 3).outcome, ClaimOutcome::kClaimed);
  EXPECT_EQ(state.release_chunk(id, 0, JobError{ErrorCode::kTransientIo, "disk hiccup", 0}),
            TransitionResult::kApplied);
  const auto chunk = state.get_chunk(id, 0);
  ASSERT_TRUE(chunk.has_value());
  EXPECT_EQ(chunk->status, ChunkStatus::kPending);
  ASSERT_TRUE(chunk->error.has_value());
  EXPECT_EQ(chunk->error->code, ErrorCode::kTransientIo);
  EXPECT_EQ(state.release_chunk(id, 0, JobError{}), TransitionResult::kStale);
}

TEST(JobStateStore, FailChunkFailsJobNamingTheChunk) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  const std::string id = make_processing_job(state, 3);

  ASSERT_EQ(state.claim_chunk(id, 1, 3).outcome, ClaimOutcome::kClaimed);
  EXPECT_EQ(state.fail_chunk(id, 1, JobError{ErrorCode::kCorruptInput, "bad frame", std::nullopt}),
            TransitionResult::kApplied);

  const auto job = state.get_job(id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status, JobStatus::kFailed);
  ASSERT_TRUE(job->error.has_value());
  EXPECT_EQ(job->error->code, ErrorCode::kCorruptInput);
  ASSERT_TRUE(job->error->chunk_index.has_value());
  EXPECT_EQ(*job->error->chunk_index, 1);
  EXPECT_NE(job->error->message.find("chunk 1"), std::string::npos);
  EXPECT_EQ(state.get_chunk(id, 1)->status, ChunkStatus::kFailed);
}

TEST(JobStateStore, IncrementIsIdempotentPerChunk) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  const std::string id = make_processing_job(state, 2);

  const auto r0 = result_for(0);
  const CompletionResult first = state.increment_and_check_completion(id, 0, &r0);
  EXPECT_EQ(first.result, TransitionResult::kApplied);
  EXPECT_FALSE(first.already_counted);
  EXPECT_EQ(first.chunks_completed, 1);

  ChunkResult other;
  other.output_ref = "blob:second-attempt";
  const CompletionResult again = state.increment_and_check_completion(id, 0, &other);
  EXPECT_EQ(again.result, TransitionResult::kApplied);
  EXPECT_TRUE(again.already_counted);
  EXPECT_FALSE(again.trigger_stitch);
  EXPECT_EQ(again.chunks_completed, 1);

  // The first result sticks.
  EXPECT_EQ(state.get_chunk(id, 0)->output_ref, "blob:out-0");
  EXPECT_EQ(state.get_job(id)->chunks_completed, 1);
  EXPECT_EQ(state.get_job(id)->status, JobStatus::kProcessing);

  const auto r1 = result_for(1);
  const CompletionResult last = state.increment_and_check_completion(id, 1, &r1);
  EXPECT_TRUE(last.trigger_stitch);
  EXPECT_EQ(last.chunks_completed, 2);
  EXPECT_EQ(state.get_job(id)->status, JobStatus::kStitching);

  const CompletionResult replay = state.increment_and_check_completion(id, 1);
  EXPECT_FALSE(replay.trigger_stitch);
  EXPECT_TRUE(replay.already_counted);
}

TEST(JobStateStore, ConcurrentCompletionsTriggerStitchExactlyOnce) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  constexpr int kChunks = 8;
  constexpr int kDeliveriesPerChunk = 3;
  const std::string id = make_processing_job(state, kChunks);

  std::atomic<int> triggers{0};
  std::vector<std::thread> threads;
  for (int d = 0; d < kDeliveriesPerChunk; ++d) {
    for (int i = 0; i < kChunks; ++i) {
      threads.emplace_back([&, i]() {
        const auto r = result_for(i);
        const CompletionResult c = state.increment_and_check_completion(id, i, &r);
        if (c.trigger_stitch) triggers.fetch_add(1);
      });
    }
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(triggers.load(), 1);
  const auto job = state.get_job(id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status, JobStatus::kStitching);
  EXPECT_EQ(job->chunks_completed, kChunks);
  EXPECT_EQ(job->completed_indices.size(), static_cast<std::size_t>(kChunks));
}

TEST(JobStateStore, CompleteJobRequiresStitching) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  const std::string id = make_processing_job(state, 1);

  EXPECT_EQ(state.complete_job(id, "blob:final", "blob:map"), TransitionResult::kStale);
  const auto r = result_for(0);
  ASSERT_TRUE(state.increment_and_check_completion(id, 0, &r).trigger_stitch);
  EXPECT_EQ(state.complete_job(id, "blob:final", "blob:map"), TransitionResult::kApplied);
  EXPECT_EQ(state.complete_job(id, "blob:other", "blob:map"), TransitionResult::kStale);

  const auto job = state.get_job(id);
  EXPECT_EQ(job->status, JobStatus::kCompleted);
  EXPECT_EQ(job->output_ref, "blob:final");
  EXPECT_EQ(job->identity_map_ref, "blob:map");
}

TEST(JobStateStore, EraseRemovesJobAndChunks) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  const std::string id = make_processing_job(state, 3);
  EXPECT_TRUE(state.erase_job(id));
  EXPECT_FALSE(state.get_job(id).has_value());
  EXPECT_FALSE(state.get_chunk(id, 0).has_value());
  EXPECT_EQ(records.size(), 0u);
}

TEST(JobModel, CorruptRecordReadsAsMissing) {
  MemoryRecordStore records;
  JobStateStore state(&records);
  ASSERT_EQ(records.create(kv_key_job("job-broken"), dump_json_bytes(nlohmann::json{{"status", "NOPE"}})),
            StoreStatus::kOk);
  EXPECT_FALSE(state.get_job("job-broken").has_value());
  EXPECT_EQ(state.transition_job("job-broken", JobStatus::kQueued, JobStatus::kChunking),
            TransitionResult::kStoreError);
}

TEST(JobModel, TransitionTable) {
  EXPECT_TRUE(job_transition_allowed(JobStatus::kQueued, JobStatus::kChunking));
  EXPECT_TRUE(job_transition_allowed(JobStatus::kProcessing, JobStatus::kFailed));
  EXPECT_FALSE(job_transition_allowed(JobStatus::kQueued, JobStatus::kProcessing));
  EXPECT_FALSE(job_transition_allowed(JobStatus::kCompleted, JobStatus::kFailed));
  EXPECT_FALSE(job_transition_allowed(JobStatus::kFailed, JobStatus::kStitching));
  EXPECT_TRUE(chunk_transition_allowed(ChunkStatus::kProcessing, ChunkStatus::kPending));
  EXPECT_FALSE(chunk_transition_allowed(ChunkStatus::kDone, ChunkStatus::kProcessing));
}
