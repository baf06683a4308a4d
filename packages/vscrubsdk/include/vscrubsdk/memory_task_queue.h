#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "vscrubsdk/task_queue.h"

namespace vscrub::sdk {

namespace detail {
struct MemoryQueueState;
}  // namespace detail

// In-process task queue with the same delivery semantics as the JetStream
// work queue: visibility timeout, delayed negative acknowledgment and a
// max-deliver bound. Used by tests and single-process runs.
class MemoryTaskQueue final : public TaskQueue {
 public:
  struct Config {
    std::int64_t visibility_timeout_ms = 30000;
    int max_deliver = 0;  // 0 = unbounded
    // Dropped tasks kept for inspection; the oldest are discarded beyond this.
    std::size_t dead_letter_limit = 256;
  };

  MemoryTaskQueue();
  explicit MemoryTaskQueue(Config cfg);
  ~MemoryTaskQueue() override;

  bool enqueue(const Task& task, std::string* err = nullptr) override;
  std::optional<Delivery> deliver(std::int64_t timeout_ms) override;

  // Wakes every blocked deliver() call; later calls return immediately.
  void shutdown();

  std::size_t pending_count() const;
  int enqueued_count(TaskKind kind) const;
  std::vector<Task> dead_letters() const;

 private:
  std::shared_ptr<detail::MemoryQueueState> state_;
};

}  // namespace vscrub::sdk
