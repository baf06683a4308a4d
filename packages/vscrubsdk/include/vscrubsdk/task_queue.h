#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vscrub::sdk {

enum class TaskKind : std::uint8_t {
  kIngest,
  kChunk,
  kStitch,
};

const char* to_string(TaskKind kind);
bool parse_task_kind(const std::string& text, TaskKind& out);

// Lower-case subject token of a kind ("ingest", "chunk", "stitch").
std::string task_kind_token(TaskKind kind);

struct Task {
  TaskKind kind = TaskKind::kIngest;
  std::string job_id;
  std::optional<int> index;  // CHUNK only
  int attempt_count = 0;
};

nlohmann::json task_to_json(const Task& task);
bool task_from_json(const nlohmann::json& j, Task& out, std::string& err);

// Acknowledgment of one delivery. Exactly one of ack / nack should be called;
// without either the task becomes visible again after the visibility timeout.
class AckHandle {
 public:
  virtual ~AckHandle() = default;
  virtual bool ack() = 0;
  virtual bool nack(std::int64_t delay_ms) = 0;
  // Extends the visibility timeout of a long-running delivery.
  virtual bool in_progress() = 0;
};

struct Delivery {
  Task task;
  int delivery_count = 1;  // 1 on first delivery
  std::unique_ptr<AckHandle> ack;
};

// At-least-once task queue. No ordering across tasks, no deduplication.
class TaskQueue {
 public:
  virtual ~TaskQueue() = default;

  // Returns only once the task is durably queued.
  virtual bool enqueue(const Task& task, std::string* err = nullptr) = 0;

  // Waits up to `timeout_ms` for the next visible task.
  virtual std::optional<Delivery> deliver(std::int64_t timeout_ms) = 0;
};

}  // namespace vscrub::sdk
