#include <gtest/gtest.h>

#include <chrono>

#include "test_support.h"
#include "vscrubsdk/memory_record_store.h"
#include "vscrubsdk/memory_task_queue.h"
#include "vscrubsdk/orchestrator.h"

using namespace vscrub::sdk;
using vscrub::test::FakeConcatenator;
using vscrub::test::FakePipeline;
using vscrub::test::MemoryBlobStore;
using vscrub::test::RecordingNotifier;
using vscrub::test::wait_until;

namespace {

OrchestratorConfig fast_config() {
  OrchestratorConfig cfg;
  cfg.chunk_duration_s = 10.0;
  cfg.overlap_s = 1.0;
  cfg.chunk_max_attempts = 3;
  cfg.io_retry_attempts = 1;
  cfg.io_backoff_base_ms = 0;
  cfg.redelivery_backoff_base_ms = 5;
  cfg.redelivery_backoff_max_ms = 20;
  cfg.worker_count = 4;
  cfg.poll_timeout_ms = 20;
  return cfg;
}

bool job_in(JobStateStore& state, const std::string& id, JobStatus status) {
  const auto job = state.get_job(id);
  return job.has_value() && job->status == status;
}

}  // namespace

TEST(EndToEnd, JobCompletesWithOneStitch) {
  MemoryRecordStore records;
  MemoryTaskQueue queue;
  MemoryBlobStore blobs;
  FakePipeline pipeline;
  FakeConcatenator concat;
  RecordingNotifier notifier;
  blobs.add_input("blob:movie", 95.0);

  Orchestrator engine(fast_config(), &records, &queue, &blobs, &pipeline, &concat, &notifier);
  engine.start_workers();

  NewJob req;
  req.input_ref = "blob:movie";
  const auto id = engine.api().create_job(req);
  ASSERT_TRUE(id.has_value());

  ASSERT_TRUE(wait_until([&]() { return job_in(engine.state(), *id, JobStatus::kCompleted); },
                         std::chrono::seconds(10)));
  engine.stop_workers();

  const auto job = engine.state().get_job(*id);
  EXPECT_EQ(job->chunk_count.value_or(0), 10);
  EXPECT_EQ(job->chunks_completed, 10);
  EXPECT_EQ(queue.enqueued_count(TaskKind::kStitch), 1);
  EXPECT_EQ(concat.calls(), 1);
  EXPECT_EQ(concat.last_paths().size(), 10u);
  ASSERT_EQ(notifier.events().size(), 1u);
  EXPECT_EQ(notifier.events()[0].status, JobStatus::kCompleted);

  const auto view = engine.api().get_job(*id);
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->output_ref, job->output_ref);
  EXPECT_FALSE(view->identity_map_ref.empty());
}

TEST(EndToEnd, TransientFailuresAreAbsorbed) {
  MemoryRecordStore records;
  MemoryTaskQueue queue;
  MemoryBlobStore blobs;
  FakePipeline pipeline;
  FakeConcatenator concat;
  blobs.add_input("blob:movie", 35.0);
  pipeline.fail(1, ErrorCode::kTransientIo, 2);
  pipeline.fail(3, ErrorCode::kModelInference, 1);

  Orchestrator engine(fast_config(), &records, &queue, &blobs, &pipeline, &concat);
  engine.start_workers();
  NewJob req;
  req.input_ref = "blob:movie";
  const auto id = engine.api().create_job(req);
  ASSERT_TRUE(id.has_value());

  ASSERT_TRUE(wait_until([&]() { return job_in(engine.state(), *id, JobStatus::kCompleted); },
                         std::chrono::seconds(10)));
  engine.stop_workers();

  EXPECT_EQ(pipeline.renders(1), 3);
  EXPECT_EQ(pipeline.renders(3), 2);
  EXPECT_EQ(engine.state().get_chunk(*id, 1)->attempt_count, 3);
  EXPECT_EQ(queue.enqueued_count(TaskKind::kStitch), 1);
}

TEST(EndToEnd, PersistentFailureFailsJob) {
  MemoryRecordStore records;
  MemoryTaskQueue queue;
  MemoryBlobStore blobs;
  FakePipeline pipeline;
  FakeConcatenator concat;
  RecordingNotifier notifier;
  blobs.add_input("blob:movie", 35.0);
  pipeline.fail(2, ErrorCode::kTransientIo, -1);

  Orchestrator engine(fast_config(), &records, &queue, &blobs, &pipeline, &concat, &notifier);
  engine.start_workers();
  NewJob req;
  req.input_ref = "blob:movie";
  const auto id = engine.api().create_job(req);
  ASSERT_TRUE(id.has_value());

  ASSERT_TRUE(
      wait_until([&]() { return job_in(engine.state(), *id, JobStatus::kFailed); }, std::chrono::seconds(10)));
  engine.stop_workers();

  const auto job = engine.state().get_job(*id);
  EXPECT_EQ(job->error->chunk_index.value_or(-1), 2);
  EXPECT_EQ(job->error->code, ErrorCode::kTransientIo);
  EXPECT_EQ(pipeline.renders(2), 3);
  EXPECT_EQ(queue.enqueued_count(TaskKind::kStitch), 0);
  EXPECT_EQ(concat.calls(), 0);
}

TEST(EndToEnd, ManyJobsShareWorkers) {
  MemoryRecordStore records;
  MemoryTaskQueue queue;
  MemoryBlobStore blobs;
  FakePipeline pipeline;
  FakeConcatenator concat;
  blobs.add_input("blob:a", 22.0);
  blobs.add_input("blob:b", 41.0);
  blobs.add_input("blob:c", 5.0);

  Orchestrator engine(fast_config(), &records, &queue, &blobs, &pipeline, &concat);
  engine.start_workers();
  std::vector<std::string> ids;
  for (const char* ref : {"blob:a", "blob:b", "blob:c"}) {
    NewJob req;
    req.input_ref = ref;
    const auto id = engine.api().create_job(req);
    ASSERT_TRUE(id.has_value());
    ids.push_back(*id);
  }
  ASSERT_TRUE(wait_until(
      [&]() {
        for (const auto& id : ids) {
          if (!job_in(engine.state(), id, JobStatus::kCompleted)) return false;
        }
        return true;
      },
      std::chrono::seconds(10)));
  engine.stop_workers();
  EXPECT_EQ(queue.enqueued_count(TaskKind::kStitch), 3);
  EXPECT_EQ(concat.calls(), 3);
}
