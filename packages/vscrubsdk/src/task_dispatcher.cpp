#include "vscrubsdk/task_dispatcher.h"

#include <exception>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "vscrubsdk/time_utils.h"

namespace vscrub::sdk {

TaskDispatcher::TaskDispatcher(Config cfg, TaskQueue* queue) : cfg_(cfg), queue_(queue) {
  if (queue_ == nullptr) {
    throw std::invalid_argument("TaskDispatcher requires a queue");
  }
}

bool TaskDispatcher::enqueue(const Task& task, std::string* err) {
  std::string local_err;
  if (!queue_->enqueue(task, &local_err)) {
    spdlog::warn("enqueue failed kind={} jobId={} err={}", to_string(task.kind), task.job_id, local_err);
    if (err != nullptr) *err = local_err;
    return false;
  }
  spdlog::debug("enqueued kind={} jobId={} index={}", to_string(task.kind), task.job_id, task.index.value_or(-1));
  return true;
}

bool TaskDispatcher::enqueue_ingest(const std::string& job_id, std::string* err) {
  Task t;
  t.kind = TaskKind::kIngest;
  t.job_id = job_id;
  return enqueue(t, err);
}

bool TaskDispatcher::enqueue_chunk(const std::string& job_id, int index, int attempt_count, std::string* err) {
  Task t;
  t.kind = TaskKind::kChunk;
  t.job_id = job_id;
  t.index = index;
  t.attempt_count = attempt_count;
  return enqueue(t, err);
}

bool TaskDispatcher::enqueue_stitch(const std::string& job_id, std::string* err) {
  Task t;
  t.kind = TaskKind::kStitch;
  t.job_id = job_id;
  return enqueue(t, err);
}

void TaskDispatcher::set_handler(TaskKind kind, Handler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  handlers_[static_cast<std::size_t>(kind)] = std::move(handler);
}

TaskDispatcher::Handler TaskDispatcher::handler_for(TaskKind kind) const {
  std::lock_guard<std::mutex> lock(mu_);
  return handlers_[static_cast<std::size_t>(kind)];
}

bool TaskDispatcher::dispatch_once(std::int64_t timeout_ms) {
  auto delivery = queue_->deliver(timeout_ms);
  if (!delivery.has_value()) {
    return false;
  }
  const Task& task = delivery->task;
  AckHandle* ack = delivery->ack.get();

  TaskContext ctx;
  ctx.delivery_count = delivery->delivery_count;
  ctx.keepalive = [ack]() { (void)ack->in_progress(); };

  HandlerOutcome outcome = HandlerOutcome::kRetry;
  const Handler handler = handler_for(task.kind);
  if (!handler) {
    spdlog::error("no handler registered kind={}", to_string(task.kind));
  } else {
    try {
      outcome = handler(task, ctx);
    } catch (const std::exception& ex) {
      spdlog::error("task handler threw kind={} jobId={} index={} err={}", to_string(task.kind), task.job_id,
                    task.index.value_or(-1), ex.what());
      outcome = HandlerOutcome::kRetry;
    }
  }

  if (outcome == HandlerOutcome::kAck) {
    if (!ack->ack()) {
      spdlog::warn("ack failed kind={} jobId={}; the task will be redelivered", to_string(task.kind), task.job_id);
    }
    return true;
  }
  const std::int64_t delay =
      backoff_ms(delivery->delivery_count, cfg_.redelivery_backoff_base_ms, cfg_.redelivery_backoff_max_ms);
  spdlog::info("task retry kind={} jobId={} index={} delivery={} delayMs={}", to_string(task.kind), task.job_id,
               task.index.value_or(-1), delivery->delivery_count, delay);
  if (!ack->nack(delay)) {
    spdlog::warn("nack failed kind={} jobId={}; redelivery after the visibility timeout", to_string(task.kind),
                 task.job_id);
  }
  return true;
}

}  // namespace vscrub::sdk
