#include "vscrubsdk/memory_task_queue.h"

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

namespace vscrub::sdk {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds ms(std::int64_t v) { return std::chrono::milliseconds(v < 0 ? 0 : v); }

}  // namespace

namespace detail {

struct MemoryQueueState {
  struct Entry {
    Task task;
    Clock::time_point visible_at;
    int delivery_count = 0;
  };

  MemoryTaskQueue::Config cfg;
  mutable std::mutex mu;
  std::condition_variable cv;
  std::map<std::uint64_t, Entry> entries;
  std::uint64_t next_id = 1;
  bool closed = false;
  std::map<TaskKind, int> enqueued;
  std::deque<Task> dead;
};

}  // namespace detail

namespace {

class MemoryAckHandle final : public AckHandle {
 public:
  MemoryAckHandle(std::weak_ptr<detail::MemoryQueueState> state, std::uint64_t id) : state_(std::move(state)), id_(id) {}

  bool ack() override {
    auto st = state_.lock();
    if (!st) return false;
    std::lock_guard<std::mutex> lock(st->mu);
    return st->entries.erase(id_) > 0;
  }

  bool nack(std::int64_t delay_ms) override {
    auto st = state_.lock();
    if (!st) return false;
    {
      std::lock_guard<std::mutex> lock(st->mu);
      auto it = st->entries.find(id_);
      if (it == st->entries.end()) return false;
      it->second.visible_at = Clock::now() + ms(delay_ms);
    }
    st->cv.notify_all();
    return true;
  }

  bool in_progress() override {
    auto st = state_.lock();
    if (!st) return false;
    std::lock_guard<std::mutex> lock(st->mu);
    auto it = st->entries.find(id_);
    if (it == st->entries.end()) return false;
    it->second.visible_at = Clock::now() + ms(st->cfg.visibility_timeout_ms);
    return true;
  }

 private:
  std::weak_ptr<detail::MemoryQueueState> state_;
  std::uint64_t id_ = 0;
};

}  // namespace

MemoryTaskQueue::MemoryTaskQueue() : MemoryTaskQueue(Config{}) {}

MemoryTaskQueue::MemoryTaskQueue(Config cfg) : state_(std::make_shared<detail::MemoryQueueState>()) { state_->cfg = cfg; }

MemoryTaskQueue::~MemoryTaskQueue() { shutdown(); }

bool MemoryTaskQueue::enqueue(const Task& task, std::string* err) {
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (state_->closed) {
      if (err != nullptr) *err = "queue is shut down";
      return false;
    }
    detail::MemoryQueueState::Entry e;
    e.task = task;
    e.visible_at = Clock::now();
    state_->entries.emplace(state_->next_id++, std::move(e));
    state_->enqueued[task.kind] += 1;
  }
  state_->cv.notify_one();
  return true;
}

std::optional<Delivery> MemoryTaskQueue::deliver(std::int64_t timeout_ms) {
  const auto deadline = Clock::now() + ms(timeout_ms);
  std::unique_lock<std::mutex> lock(state_->mu);
  while (true) {
    if (state_->closed) return std::nullopt;
    const auto now = Clock::now();
    auto next_visible = Clock::time_point::max();
    for (auto it = state_->entries.begin(); it != state_->entries.end();) {
      detail::MemoryQueueState::Entry& e = it->second;
      if (e.visible_at > now) {
        next_visible = std::min(next_visible, e.visible_at);
        ++it;
        continue;
      }
      if (state_->cfg.max_deliver > 0 && e.delivery_count >= state_->cfg.max_deliver) {
        spdlog::warn("task dropped after max deliveries kind={} jobId={} deliveries={}", to_string(e.task.kind),
                     e.task.job_id, e.delivery_count);
        state_->dead.push_back(e.task);
        while (state_->dead.size() > state_->cfg.dead_letter_limit) {
          state_->dead.pop_front();
        }
        it = state_->entries.erase(it);
        continue;
      }
      e.delivery_count += 1;
      e.visible_at = now + ms(state_->cfg.visibility_timeout_ms);
      Delivery d;
      d.task = e.task;
      d.delivery_count = e.delivery_count;
      d.ack = std::make_unique<MemoryAckHandle>(state_, it->first);
      return d;
    }
    if (now >= deadline) return std::nullopt;
    state_->cv.wait_until(lock, std::min(deadline, next_visible));
  }
}

void MemoryTaskQueue::shutdown() {
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    state_->closed = true;
  }
  state_->cv.notify_all();
}

std::size_t MemoryTaskQueue::pending_count() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->entries.size();
}

int MemoryTaskQueue::enqueued_count(TaskKind kind) const {
  std::lock_guard<std::mutex> lock(state_->mu);
  auto it = state_->enqueued.find(kind);
  return it == state_->enqueued.end() ? 0 : it->second;
}

std::vector<Task> MemoryTaskQueue::dead_letters() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return std::vector<Task>(state_->dead.begin(), state_->dead.end());
}

}  // namespace vscrub::sdk
