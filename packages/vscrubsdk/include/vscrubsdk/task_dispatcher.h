#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "vscrubsdk/task_queue.h"

namespace vscrub::sdk {

enum class HandlerOutcome : std::uint8_t {
  kAck,    // done, or nothing left to do
  kRetry,  // negative acknowledgment; redelivered after a backoff delay
};

struct TaskContext {
  int delivery_count = 1;
  // Extends the visibility timeout while a long handler is running.
  std::function<void()> keepalive;
};

// Routes deliveries of the at-least-once queue to one handler per task kind and
// settles every delivery with ack or a backed-off nack.
class TaskDispatcher {
 public:
  struct Config {
    std::int64_t redelivery_backoff_base_ms = 1000;
    std::int64_t redelivery_backoff_max_ms = 60000;
  };

  using Handler = std::function<HandlerOutcome(const Task& task, const TaskContext& ctx)>;

  TaskDispatcher(Config cfg, TaskQueue* queue);

  bool enqueue(const Task& task, std::string* err = nullptr);
  bool enqueue_ingest(const std::string& job_id, std::string* err = nullptr);
  bool enqueue_chunk(const std::string& job_id, int index, int attempt_count = 0, std::string* err = nullptr);
  bool enqueue_stitch(const std::string& job_id, std::string* err = nullptr);

  void set_handler(TaskKind kind, Handler handler);

  // Delivers and handles at most one task. Returns false when nothing arrived in time.
  bool dispatch_once(std::int64_t timeout_ms);

 private:
  Handler handler_for(TaskKind kind) const;

  Config cfg_;
  TaskQueue* queue_ = nullptr;
  mutable std::mutex mu_;
  std::array<Handler, 3> handlers_;
};

}  // namespace vscrub::sdk
