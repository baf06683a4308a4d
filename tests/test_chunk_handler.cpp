#include <gtest/gtest.h>

#include "test_support.h"
#include "vscrubsdk/chunk_handler.h"
#include "vscrubsdk/ingestion_coordinator.h"
#include "vscrubsdk/memory_record_store.h"
#include "vscrubsdk/memory_task_queue.h"

using namespace vscrub::sdk;
using vscrub::test::FakePipeline;
using vscrub::test::FlakyRecordStore;
using vscrub::test::MemoryBlobStore;
using vscrub::test::RecordingNotifier;

namespace {

class ChunkHandlerTest : public ::testing::Test {
 protected:
  ChunkHandlerTest()
      : flaky_(&records_),
        state_(&flaky_),
        dispatcher_(TaskDispatcher::Config{}, &queue_),
        ingestion_(ingestion_config(), &state_, &blobs_, &dispatcher_, &notifier_),
        handler_(handler_config(), &state_, &blobs_, &pipeline_, &dispatcher_, &notifier_) {}

  static IngestionCoordinator::Config ingestion_config() {
    IngestionCoordinator::Config cfg;
    cfg.chunk_duration_s = 60.0;
    cfg.overlap_s = 5.0;
    cfg.io_backoff_base_ms = 0;
    return cfg;
  }

  static ChunkHandler::Config handler_config() {
    ChunkHandler::Config cfg;
    cfg.max_attempts = 3;
    cfg.overlap_s = 5.0;
    cfg.io_retry_attempts = 1;  // one render per delivery
    cfg.io_backoff_base_ms = 0;
    return cfg;
  }

  // Job of 125 s ingested into three chunks.
  std::string ingested_job() {
    blobs_.add_input("blob:movie", 125.0);
    NewJob req;
    req.input_ref = "blob:movie";
    auto job = state_.create_job(req);
    EXPECT_TRUE(job.has_value());
    Task t;
    t.kind = TaskKind::kIngest;
    t.job_id = job->job_id;
    EXPECT_EQ(ingestion_.handle(t, TaskContext{}), HandlerOutcome::kAck);
    return job->job_id;
  }

  HandlerOutcome run_chunk(const std::string& job_id, int index, int delivery = 1) {
    Task t;
    t.kind = TaskKind::kChunk;
    t.job_id = job_id;
    t.index = index;
    TaskContext ctx;
    ctx.delivery_count = delivery;
    return handler_.handle(t, ctx);
  }

  MemoryRecordStore records_;
  FlakyRecordStore flaky_;
  MemoryTaskQueue queue_;
  MemoryBlobStore blobs_;
  FakePipeline pipeline_;
  RecordingNotifier notifier_;
  JobStateStore state_;
  TaskDispatcher dispatcher_;
  IngestionCoordinator ingestion_;
  ChunkHandler handler_;
};

}  // namespace

TEST_F(ChunkHandlerTest, RendersAndCompletesChunk) {
  const std::string id = ingested_job();
  EXPECT_EQ(run_chunk(id, 0), HandlerOutcome::kAck);

  const auto chunk = state_.get_chunk(id, 0);
  ASSERT_TRUE(chunk.has_value());
  EXPECT_EQ(chunk->status, ChunkStatus::kDone);
  EXPECT_FALSE(chunk->output_ref.empty());
  EXPECT_TRUE(blobs_.contains(chunk->output_ref));
  EXPECT_TRUE(chunk->head_tracks.empty());
  EXPECT_EQ(chunk->boundary_tracks.size(), 1u);
  EXPECT_EQ(state_.get_job(id)->chunks_completed, 1);
}

TEST_F(ChunkHandlerTest, OverlapWindowsFollowTheSpan) {
  const std::string id = ingested_job();
  ASSERT_EQ(run_chunk(id, 0), HandlerOutcome::kAck);
  ASSERT_EQ(run_chunk(id, 1), HandlerOutcome::kAck);
  ASSERT_EQ(run_chunk(id, 2), HandlerOutcome::kAck);
  const auto reqs = pipeline_.requests();
  ASSERT_EQ(reqs.size(), 3u);

  // First chunk has no head window, last chunk no tail window.
  EXPECT_DOUBLE_EQ(reqs[0].head_window_begin_s, reqs[0].head_window_end_s);
  EXPECT_DOUBLE_EQ(reqs[0].tail_window_begin_s, 55.0);
  EXPECT_DOUBLE_EQ(reqs[0].tail_window_end_s, 65.0);

  EXPECT_DOUBLE_EQ(reqs[1].head_window_begin_s, 55.0);
  EXPECT_DOUBLE_EQ(reqs[1].head_window_end_s, 65.0);
  EXPECT_DOUBLE_EQ(reqs[1].tail_window_begin_s, 115.0);
  EXPECT_DOUBLE_EQ(reqs[1].tail_window_end_s, 125.0);

  EXPECT_DOUBLE_EQ(reqs[2].head_window_begin_s, 115.0);
  EXPECT_DOUBLE_EQ(reqs[2].head_window_end_s, 125.0);
  EXPECT_DOUBLE_EQ(reqs[2].tail_window_begin_s, reqs[2].tail_window_end_s);
}

TEST_F(ChunkHandlerTest, RedeliveryAfterDoneIsNoOp) {
  const std::string id = ingested_job();
  ASSERT_EQ(run_chunk(id, 1), HandlerOutcome::kAck);
  const std::string first_ref = state_.get_chunk(id, 1)->output_ref;

  EXPECT_EQ(run_chunk(id, 1, 2), HandlerOutcome::kAck);
  EXPECT_EQ(pipeline_.renders(1), 1);
  EXPECT_EQ(state_.get_chunk(id, 1)->output_ref, first_ref);
  EXPECT_EQ(state_.get_job(id)->chunks_completed, 1);
}

TEST_F(ChunkHandlerTest, LastChunkTriggersOneStitch) {
  const std::string id = ingested_job();
  for (int i = 0; i < 3; ++i) ASSERT_EQ(run_chunk(id, i), HandlerOutcome::kAck);
  EXPECT_EQ(state_.get_job(id)->status, JobStatus::kStitching);
  EXPECT_EQ(queue_.enqueued_count(TaskKind::kStitch), 1);

  // Late duplicates of every chunk change nothing.
  for (int i = 0; i < 3; ++i) ASSERT_EQ(run_chunk(id, i, 2), HandlerOutcome::kAck);
  EXPECT_EQ(queue_.enqueued_count(TaskKind::kStitch), 1);
}

TEST_F(ChunkHandlerTest, RetryableFailureReleasesChunk) {
  const std::string id = ingested_job();
  pipeline_.fail(0, ErrorCode::kTransientIo, 1);

  EXPECT_EQ(run_chunk(id, 0), HandlerOutcome::kRetry);
  const auto released = state_.get_chunk(id, 0);
  EXPECT_EQ(released->status, ChunkStatus::kPending);
  EXPECT_EQ(released->attempt_count, 1);
  ASSERT_TRUE(released->error.has_value());
  EXPECT_EQ(released->error->code, ErrorCode::kTransientIo);

  EXPECT_EQ(run_chunk(id, 0, 2), HandlerOutcome::kAck);
  EXPECT_EQ(state_.get_chunk(id, 0)->status, ChunkStatus::kDone);
  EXPECT_EQ(state_.get_chunk(id, 0)->attempt_count, 2);
}

TEST_F(ChunkHandlerTest, ExhaustedBudgetFailsJobAndKeepsOtherOutputs) {
  const std::string id = ingested_job();
  pipeline_.fail(1, ErrorCode::kModelInference, -1);

  ASSERT_EQ(run_chunk(id, 0), HandlerOutcome::kAck);
  ASSERT_EQ(run_chunk(id, 2), HandlerOutcome::kAck);
  EXPECT_EQ(run_chunk(id, 1, 1), HandlerOutcome::kRetry);
  EXPECT_EQ(run_chunk(id, 1, 2), HandlerOutcome::kRetry);
  EXPECT_EQ(run_chunk(id, 1, 3), HandlerOutcome::kAck);
  EXPECT_EQ(pipeline_.renders(1), 3);

  const auto job = state_.get_job(id);
  EXPECT_EQ(job->status, JobStatus::kFailed);
  ASSERT_TRUE(job->error.has_value());
  EXPECT_EQ(job->error->code, ErrorCode::kModelInference);
  ASSERT_TRUE(job->error->chunk_index.has_value());
  EXPECT_EQ(*job->error->chunk_index, 1);
  EXPECT_NE(job->error->message.find("chunk 1"), std::string::npos);
  EXPECT_EQ(state_.get_chunk(id, 1)->status, ChunkStatus::kFailed);

  // Outputs of the healthy chunks stay for inspection.
  EXPECT_TRUE(blobs_.contains(state_.get_chunk(id, 0)->output_ref));
  EXPECT_TRUE(blobs_.contains(state_.get_chunk(id, 2)->output_ref));
  EXPECT_EQ(queue_.enqueued_count(TaskKind::kStitch), 0);

  ASSERT_EQ(notifier_.events().size(), 1u);
  EXPECT_EQ(notifier_.events()[0].status, JobStatus::kFailed);

  // A further redelivery finds the chunk FAILED and does nothing.
  EXPECT_EQ(run_chunk(id, 1, 4), HandlerOutcome::kAck);
  EXPECT_EQ(pipeline_.renders(1), 3);
}

TEST_F(ChunkHandlerTest, CorruptChunkFailsWithoutRetry) {
  const std::string id = ingested_job();
  pipeline_.fail(2, ErrorCode::kCorruptInput, -1);

  EXPECT_EQ(run_chunk(id, 2), HandlerOutcome::kAck);
  EXPECT_EQ(pipeline_.renders(2), 1);
  const auto job = state_.get_job(id);
  EXPECT_EQ(job->status, JobStatus::kFailed);
  EXPECT_EQ(job->error->code, ErrorCode::kCorruptInput);
  EXPECT_EQ(job->error->chunk_index.value_or(-1), 2);
}

TEST_F(ChunkHandlerTest, CancelStopsInFlightWork) {
  const std::string id = ingested_job();
  pipeline_.before_render = [&](const ChunkRenderRequest& req) {
    state_.fail_job(req.job_id, JobError{ErrorCode::kCancelled, "cancelled by request", std::nullopt});
  };

  EXPECT_EQ(run_chunk(id, 0), HandlerOutcome::kAck);
  EXPECT_EQ(blobs_.put_count(), 0);
  EXPECT_NE(state_.get_chunk(id, 0)->status, ChunkStatus::kDone);
  EXPECT_EQ(state_.get_job(id)->error->code, ErrorCode::kCancelled);
  EXPECT_EQ(state_.get_job(id)->chunks_completed, 0);

  // Chunks delivered after the cancellation are skipped outright.
  pipeline_.before_render = nullptr;
  EXPECT_EQ(run_chunk(id, 1), HandlerOutcome::kAck);
  EXPECT_EQ(pipeline_.renders(1), 0);
}

TEST_F(ChunkHandlerTest, MissingChunkIsAcked) {
  const std::string id = ingested_job();
  EXPECT_EQ(run_chunk(id, 9), HandlerOutcome::kAck);
  EXPECT_EQ(run_chunk("job-unknown", 0), HandlerOutcome::kAck);
}

TEST_F(ChunkHandlerTest, UploadFailureReleasesChunk) {
  const std::string id = ingested_job();
  blobs_.fail_puts(1);
  EXPECT_EQ(run_chunk(id, 0), HandlerOutcome::kRetry);
  EXPECT_EQ(state_.get_chunk(id, 0)->status, ChunkStatus::kPending);
  EXPECT_EQ(run_chunk(id, 0, 2), HandlerOutcome::kAck);
  EXPECT_EQ(state_.get_chunk(id, 0)->status, ChunkStatus::kDone);
}

TEST_F(ChunkHandlerTest, UnreadableChunkRecordIsRetried) {
  const std::string id = ingested_job();
  flaky_.fail_gets("chunks.", 1);

  EXPECT_EQ(run_chunk(id, 0), HandlerOutcome::kRetry);
  EXPECT_EQ(flaky_.failed_gets(), 1);
  EXPECT_EQ(pipeline_.renders(0), 0);
  const auto chunk = state_.get_chunk(id, 0);
  EXPECT_EQ(chunk->status, ChunkStatus::kPending);
  EXPECT_EQ(chunk->attempt_count, 0);

  EXPECT_EQ(run_chunk(id, 0, 2), HandlerOutcome::kAck);
  EXPECT_EQ(state_.get_chunk(id, 0)->status, ChunkStatus::kDone);
}

TEST_F(ChunkHandlerTest, UnreadableJobRecordIsRetried) {
  const std::string id = ingested_job();
  flaky_.fail_gets("jobs.", 1);

  EXPECT_EQ(run_chunk(id, 0), HandlerOutcome::kRetry);
  EXPECT_EQ(pipeline_.renders(0), 0);
  EXPECT_EQ(state_.get_chunk(id, 0)->status, ChunkStatus::kPending);
  EXPECT_EQ(state_.get_job(id)->status, JobStatus::kProcessing);
}

TEST_F(ChunkHandlerTest, ReadErrorDuringRenderDoesNotAbort) {
  const std::string id = ingested_job();
  bool aborted = true;
  pipeline_.before_render = [&](const ChunkRenderRequest& req) {
    flaky_.fail_gets("jobs.", 1);
    aborted = req.should_abort();
  };

  EXPECT_EQ(run_chunk(id, 0), HandlerOutcome::kAck);
  EXPECT_FALSE(aborted);
  EXPECT_EQ(state_.get_chunk(id, 0)->status, ChunkStatus::kDone);
}

TEST_F(ChunkHandlerTest, RedeliveryOfInFlightChunkSpendsNoAttempt) {
  const std::string id = ingested_job();
  // A slow first worker holds the chunk; the queue redelivers it again and again.
  ASSERT_EQ(state_.claim_chunk(id, 1, 3).outcome, ClaimOutcome::kClaimed);
  for (int i = 0; i < 5; ++i) {
    ASSERT_EQ(state_.claim_chunk(id, 1, 3).outcome, ClaimOutcome::kDuplicate);
  }
  EXPECT_EQ(state_.get_chunk(id, 1)->attempt_count, 1);

  EXPECT_EQ(run_chunk(id, 1, 7), HandlerOutcome::kAck);
  const auto chunk = state_.get_chunk(id, 1);
  EXPECT_EQ(chunk->status, ChunkStatus::kDone);
  EXPECT_EQ(chunk->attempt_count, 1);
  EXPECT_EQ(state_.get_job(id)->status, JobStatus::kProcessing);
}

TEST_F(ChunkHandlerTest, KeepaliveHeartbeatsTheChunkRecord) {
  ChunkHandler::Config cfg = handler_config();
  cfg.heartbeat_ms = 1;
  ChunkHandler handler(cfg, &state_, &blobs_, &pipeline_, &dispatcher_, &notifier_);
  const std::string id = ingested_job();

  int keepalives = 0;
  std::int64_t touched_at = 0;
  std::int64_t claimed_at = 0;
  pipeline_.before_render = [&](const ChunkRenderRequest& req) {
    claimed_at = state_.get_chunk(req.job_id, req.index)->updated_at_ms;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    req.keepalive();
    touched_at = state_.get_chunk(req.job_id, req.index)->updated_at_ms;
  };

  Task t;
  t.kind = TaskKind::kChunk;
  t.job_id = id;
  t.index = 0;
  TaskContext ctx;
  ctx.keepalive = [&]() { ++keepalives; };
  EXPECT_EQ(handler.handle(t, ctx), HandlerOutcome::kAck);
  EXPECT_EQ(keepalives, 1);
  EXPECT_GT(touched_at, claimed_at);
}
