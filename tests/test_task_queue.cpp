#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>

#include "vscrubsdk/memory_task_queue.h"
#include "vscrubsdk/msg_codec.h"
#include "vscrubsdk/task_dispatcher.h"
#include "vscrubsdk/time_utils.h"

using namespace vscrub::sdk;

namespace {

Task chunk_task(const std::string& job_id, int index) {
  Task t;
  t.kind = TaskKind::kChunk;
  t.job_id = job_id;
  t.index = index;
  return t;
}

}  // namespace

TEST(TaskCodec, ChunkTaskSurvivesMsgpack) {
  Task t = chunk_task("job-1", 4);
  t.attempt_count = 2;
  const auto bytes = encode_json(task_to_json(t));

  nlohmann::json j;
  ASSERT_TRUE(decode_json(bytes.data(), bytes.size(), j));
  EXPECT_EQ(j["kind"], "CHUNK");
  EXPECT_EQ(j["jobId"], "job-1");

  Task back;
  std::string err;
  ASSERT_TRUE(task_from_json(j, back, err)) << err;
  EXPECT_EQ(back.kind, TaskKind::kChunk);
  EXPECT_EQ(back.job_id, "job-1");
  ASSERT_TRUE(back.index.has_value());
  EXPECT_EQ(*back.index, 4);
  EXPECT_EQ(back.attempt_count, 2);
}

TEST(TaskCodec, RejectsMalformedTasks) {
  Task out;
  std::string err;
  EXPECT_FALSE(task_from_json(nlohmann::json{{"kind", "CHUNK"}, {"jobId", "job-1"}}, out, err));
  EXPECT_FALSE(task_from_json(nlohmann::json{{"kind", "RENDER"}, {"jobId", "job-1"}}, out, err));
  EXPECT_FALSE(task_from_json(nlohmann::json{{"kind", "STITCH"}}, out, err));
  EXPECT_TRUE(task_from_json(nlohmann::json{{"kind", "STITCH"}, {"jobId", "job-1"}}, out, err));
  EXPECT_EQ(task_kind_token(TaskKind::kIngest), "ingest");
}

TEST(MemoryTaskQueue, UnackedTaskReappearsAfterVisibilityTimeout) {
  MemoryTaskQueue::Config cfg;
  cfg.visibility_timeout_ms = 50;
  MemoryTaskQueue queue(cfg);
  ASSERT_TRUE(queue.enqueue(chunk_task("job-1", 0)));

  auto first = queue.deliver(100);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->delivery_count, 1);
  // Invisible while the first delivery is outstanding.
  EXPECT_FALSE(queue.deliver(10).has_value());

  auto second = queue.deliver(500);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->delivery_count, 2);
  EXPECT_EQ(second->task.job_id, "job-1");
  EXPECT_TRUE(second->ack->ack());
  EXPECT_EQ(queue.pending_count(), 0u);
  // The stale handle of the first delivery no longer refers to anything.
  EXPECT_FALSE(first->ack->ack());
}

TEST(MemoryTaskQueue, NackDelaysRedelivery) {
  MemoryTaskQueue queue;
  ASSERT_TRUE(queue.enqueue(chunk_task("job-1", 0)));
  auto d = queue.deliver(100);
  ASSERT_TRUE(d.has_value());
  ASSERT_TRUE(d->ack->nack(80));

  const auto start = now_ms();
  EXPECT_FALSE(queue.deliver(20).has_value());
  auto again = queue.deliver(1000);
  ASSERT_TRUE(again.has_value());
  EXPECT_GE(now_ms() - start, 60);
  EXPECT_EQ(again->delivery_count, 2);
}

TEST(MemoryTaskQueue, MaxDeliverMovesTaskToDeadLetters) {
  MemoryTaskQueue::Config cfg;
  cfg.max_deliver = 2;
  MemoryTaskQueue queue(cfg);
  ASSERT_TRUE(queue.enqueue(chunk_task("job-1", 3)));

  for (int i = 0; i < 2; ++i) {
    auto d = queue.deliver(100);
    ASSERT_TRUE(d.has_value());
    ASSERT_TRUE(d->ack->nack(0));
  }
  EXPECT_FALSE(queue.deliver(20).has_value());
  ASSERT_EQ(queue.dead_letters().size(), 1u);
  EXPECT_EQ(queue.dead_letters()[0].index.value_or(-1), 3);
}

TEST(MemoryTaskQueue, BookkeepingStaysBounded) {
  MemoryTaskQueue::Config cfg;
  cfg.max_deliver = 1;
  cfg.dead_letter_limit = 2;
  MemoryTaskQueue queue(cfg);

  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(queue.enqueue(chunk_task("job-1", i)));
    auto d = queue.deliver(100);
    ASSERT_TRUE(d.has_value());
    ASSERT_TRUE(d->ack->nack(0));
  }
  for (int i = 0; i < 1000; ++i) {
    auto d = queue.deliver(0);
    if (!d.has_value()) break;
    ASSERT_TRUE(d->ack->ack());
  }
  EXPECT_EQ(queue.enqueued_count(TaskKind::kChunk), 5);
  EXPECT_EQ(queue.enqueued_count(TaskKind::kStitch), 0);
  const auto dead = queue.dead_letters();
  ASSERT_EQ(dead.size(), 2u);
  EXPECT_EQ(dead[0].index.value_or(-1), 3);
  EXPECT_EQ(dead[1].index.value_or(-1), 4);
}

TEST(MemoryTaskQueue, ShutdownWakesBlockedConsumers) {
  MemoryTaskQueue queue;
  std::thread consumer([&]() { EXPECT_FALSE(queue.deliver(10000).has_value()); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.shutdown();
  consumer.join();
  std::string err;
  EXPECT_FALSE(queue.enqueue(chunk_task("job-1", 0), &err));
  EXPECT_FALSE(err.empty());
}

TEST(TaskDispatcher, AcksHandledTasksAndRetriesFailures) {
  MemoryTaskQueue queue;
  TaskDispatcher::Config cfg;
  cfg.redelivery_backoff_base_ms = 1;
  cfg.redelivery_backoff_max_ms = 1;
  TaskDispatcher dispatcher(cfg, &queue);

  int calls = 0;
  dispatcher.set_handler(TaskKind::kStitch, [&](const Task&, const TaskContext& ctx) {
    ++calls;
    EXPECT_EQ(ctx.delivery_count, calls);
    return calls < 2 ? HandlerOutcome::kRetry : HandlerOutcome::kAck;
  });
  ASSERT_TRUE(dispatcher.enqueue_stitch("job-1"));

  EXPECT_TRUE(dispatcher.dispatch_once(100));
  EXPECT_EQ(queue.pending_count(), 1u);
  EXPECT_TRUE(dispatcher.dispatch_once(500));
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(queue.pending_count(), 0u);
  EXPECT_FALSE(dispatcher.dispatch_once(10));
}

TEST(TaskDispatcher, HandlerExceptionIsRetried) {
  MemoryTaskQueue queue;
  TaskDispatcher::Config cfg;
  cfg.redelivery_backoff_base_ms = 1;
  TaskDispatcher dispatcher(cfg, &queue);
  int calls = 0;
  dispatcher.set_handler(TaskKind::kIngest, [&](const Task&, const TaskContext&) -> HandlerOutcome {
    if (++calls == 1) throw std::runtime_error("boom");
    return HandlerOutcome::kAck;
  });
  ASSERT_TRUE(dispatcher.enqueue_ingest("job-1"));
  EXPECT_TRUE(dispatcher.dispatch_once(100));
  EXPECT_TRUE(dispatcher.dispatch_once(500));
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(queue.pending_count(), 0u);
}

TEST(Backoff, DoublesUpToTheCap) {
  EXPECT_EQ(backoff_ms(1, 100, 1000), 100);
  EXPECT_EQ(backoff_ms(2, 100, 1000), 200);
  EXPECT_EQ(backoff_ms(4, 100, 1000), 800);
  EXPECT_EQ(backoff_ms(9, 100, 1000), 1000);
  EXPECT_EQ(backoff_ms(3, 0, 1000), 0);
}
