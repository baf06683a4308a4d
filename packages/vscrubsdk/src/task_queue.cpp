#include "vscrubsdk/task_queue.h"

namespace vscrub::sdk {

using json = nlohmann::json;

const char* to_string(TaskKind kind) {
  switch (kind) {
    case TaskKind::kIngest:
      return "INGEST";
    case TaskKind::kChunk:
      return "CHUNK";
    case TaskKind::kStitch:
      return "STITCH";
  }
  return "INGEST";
}

bool parse_task_kind(const std::string& text, TaskKind& out) {
  if (text == "INGEST") {
    out = TaskKind::kIngest;
  } else if (text == "CHUNK") {
    out = TaskKind::kChunk;
  } else if (text == "STITCH") {
    out = TaskKind::kStitch;
  } else {
    return false;
  }
  return true;
}

std::string task_kind_token(TaskKind kind) {
  switch (kind) {
    case TaskKind::kIngest:
      return "ingest";
    case TaskKind::kChunk:
      return "chunk";
    case TaskKind::kStitch:
      return "stitch";
  }
  return "ingest";
}

json task_to_json(const Task& task) {
  json j;
  j["kind"] = to_string(task.kind);
  j["jobId"] = task.job_id;
  if (task.index.has_value()) {
    j["index"] = *task.index;
  }
  j["attemptCount"] = task.attempt_count;
  return j;
}

bool task_from_json(const json& j, Task& out, std::string& err) {
  if (!j.is_object()) {
    err = "task must be an object";
    return false;
  }
  if (!j.contains("kind") || !j["kind"].is_string() || !parse_task_kind(j["kind"].get<std::string>(), out.kind)) {
    err = "missing or invalid kind";
    return false;
  }
  if (!j.contains("jobId") || !j["jobId"].is_string() || j["jobId"].get<std::string>().empty()) {
    err = "missing jobId";
    return false;
  }
  out.job_id = j["jobId"].get<std::string>();
  out.index.reset();
  if (j.contains("index") && j["index"].is_number_integer()) {
    out.index = j["index"].get<int>();
  }
  if (out.kind == TaskKind::kChunk && (!out.index.has_value() || *out.index < 0)) {
    err = "CHUNK task requires a non-negative index";
    return false;
  }
  out.attempt_count = j.value("attemptCount", 0);
  return true;
}

}  // namespace vscrub::sdk
