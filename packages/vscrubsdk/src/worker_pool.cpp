#include "vscrubsdk/worker_pool.h"

#include <exception>

#include <spdlog/spdlog.h>

namespace vscrub::sdk {

WorkerPool::WorkerPool(TaskDispatcher* dispatcher, int worker_count, std::int64_t poll_timeout_ms)
    : dispatcher_(dispatcher),
      worker_count_(worker_count > 0 ? worker_count : 1),
      poll_timeout_ms_(poll_timeout_ms > 0 ? poll_timeout_ms : 100) {}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
  if (running_.exchange(true, std::memory_order_acq_rel)) return;
  threads_.reserve(static_cast<std::size_t>(worker_count_));
  for (int i = 0; i < worker_count_; ++i) {
    threads_.emplace_back([this, i]() { run(i); });
  }
  spdlog::info("worker pool started workers={}", worker_count_);
}

void WorkerPool::stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) return;
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
  spdlog::info("worker pool stopped handled={}", handled());
}

void WorkerPool::run(int worker_index) {
  spdlog::debug("worker started index={}", worker_index);
  while (running_.load(std::memory_order_acquire)) {
    try {
      if (dispatcher_->dispatch_once(poll_timeout_ms_)) {
        handled_.fetch_add(1, std::memory_order_relaxed);
      }
    } catch (const std::exception& ex) {
      spdlog::error("worker loop error index={} err={}", worker_index, ex.what());
    }
  }
  spdlog::debug("worker exiting index={}", worker_index);
}

}  // namespace vscrub::sdk
