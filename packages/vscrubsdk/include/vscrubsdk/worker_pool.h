#pragma once

#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

#include "vscrubsdk/task_dispatcher.h"

namespace vscrub::sdk {

// Threads that pull and handle tasks until stopped. Workers share nothing but the
// dispatcher; all coordination goes through the state store.
class WorkerPool {
 public:
  WorkerPool(TaskDispatcher* dispatcher, int worker_count, std::int64_t poll_timeout_ms);
  ~WorkerPool();
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(std::memory_order_acquire); }

  std::int64_t handled() const { return handled_.load(std::memory_order_relaxed); }

 private:
  void run(int worker_index);

  TaskDispatcher* dispatcher_ = nullptr;
  int worker_count_ = 1;
  std::int64_t poll_timeout_ms_ = 1000;
  std::atomic<bool> running_{false};
  std::atomic<std::int64_t> handled_{0};
  std::vector<std::thread> threads_;
};

}  // namespace vscrub::sdk
