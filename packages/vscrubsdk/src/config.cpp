#include "vscrubsdk/config.h"

#include <fstream>

namespace vscrub::sdk {

using json = nlohmann::json;

namespace {

template <typename T>
bool read_field(const json& j, const char* key, T& out, std::string& err) {
  if (!j.contains(key) || j[key].is_null()) {
    return true;
  }
  try {
    out = j[key].get<T>();
  } catch (const json::exception& ex) {
    err = std::string("config field ") + key + ": " + ex.what();
    return false;
  }
  return true;
}

}  // namespace

bool apply_config_json(const json& j, OrchestratorConfig& cfg, std::string& err) {
  if (!j.is_object()) {
    err = "config must be a JSON object";
    return false;
  }
  return read_field(j, "chunkDurationS", cfg.chunk_duration_s, err) &&
         read_field(j, "overlapS", cfg.overlap_s, err) && read_field(j, "tau", cfg.tau, err) &&
         read_field(j, "chunkMaxAttempts", cfg.chunk_max_attempts, err) &&
         read_field(j, "chunkHeartbeatMs", cfg.chunk_heartbeat_ms, err) &&
         read_field(j, "ioRetryAttempts", cfg.io_retry_attempts, err) &&
         read_field(j, "ioBackoffBaseMs", cfg.io_backoff_base_ms, err) &&
         read_field(j, "ioBackoffMaxMs", cfg.io_backoff_max_ms, err) &&
         read_field(j, "redeliveryBackoffBaseMs", cfg.redelivery_backoff_base_ms, err) &&
         read_field(j, "redeliveryBackoffMaxMs", cfg.redelivery_backoff_max_ms, err) &&
         read_field(j, "visibilityTimeoutMs", cfg.visibility_timeout_ms, err) &&
         read_field(j, "maxDeliver", cfg.max_deliver, err) &&
         read_field(j, "reconcileIntervalMs", cfg.reconcile_interval_ms, err) &&
         read_field(j, "ingestStaleMs", cfg.ingest_stale_ms, err) &&
         read_field(j, "processingStaleMs", cfg.processing_stale_ms, err) &&
         read_field(j, "stitchStaleMs", cfg.stitch_stale_ms, err) &&
         read_field(j, "smoothingWindow", cfg.smoothing_window, err) &&
         read_field(j, "detectorModel", cfg.detector_model, err) &&
         read_field(j, "detectors", cfg.detectors, err) &&
         read_field(j, "outputFourcc", cfg.output_fourcc, err) &&
         read_field(j, "workerCount", cfg.worker_count, err) &&
         read_field(j, "pollTimeoutMs", cfg.poll_timeout_ms, err) && read_field(j, "natsUrl", cfg.nats_url, err) &&
         read_field(j, "kvBucket", cfg.kv_bucket, err) &&
         read_field(j, "kvMemoryStorage", cfg.kv_memory_storage, err) &&
         read_field(j, "taskStream", cfg.task_stream, err) &&
         read_field(j, "subjectPrefix", cfg.subject_prefix, err) &&
         read_field(j, "consumerDurable", cfg.consumer_durable, err) &&
         read_field(j, "defaultNotifySubject", cfg.default_notify_subject, err) &&
         read_field(j, "blobRoot", cfg.blob_root, err);
}

bool split_detector_entry(const std::string& entry, std::string& label, std::string& model) {
  const auto eq = entry.find('=');
  if (eq == std::string::npos || eq == 0 || eq + 1 == entry.size()) {
    return false;
  }
  label = entry.substr(0, eq);
  model = entry.substr(eq + 1);
  return true;
}

bool load_config_file(const std::string& path, OrchestratorConfig& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) {
    err = "cannot open config file " + path;
    return false;
  }
  const json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    err = "config file is not valid JSON: " + path;
    return false;
  }
  return apply_config_json(j, cfg, err);
}

bool validate_config(const OrchestratorConfig& cfg, std::string& err) {
  if (!(cfg.chunk_duration_s > 0.0)) {
    err = "chunkDurationS must be positive";
    return false;
  }
  if (cfg.overlap_s < 0.0 || cfg.overlap_s >= cfg.chunk_duration_s) {
    err = "overlapS must be in [0, chunkDurationS)";
    return false;
  }
  if (cfg.tau < -1.0 || cfg.tau > 1.0) {
    err = "tau must be a cosine similarity in [-1, 1]";
    return false;
  }
  if (cfg.chunk_max_attempts < 1 || cfg.io_retry_attempts < 1) {
    err = "retry budgets must be at least 1";
    return false;
  }
  if (cfg.chunk_heartbeat_ms < 1 || cfg.chunk_heartbeat_ms >= cfg.processing_stale_ms) {
    err = "chunkHeartbeatMs must be positive and below processingStaleMs";
    return false;
  }
  for (const auto& entry : cfg.detectors) {
    std::string label;
    std::string model;
    if (!split_detector_entry(entry, label, model)) {
      err = "detector entry must be label=model-path: " + entry;
      return false;
    }
  }
  if (cfg.worker_count < 1) {
    err = "workerCount must be at least 1";
    return false;
  }
  if (cfg.smoothing_window < 1) {
    err = "smoothingWindow must be at least 1";
    return false;
  }
  if (cfg.output_fourcc.size() != 4) {
    err = "outputFourcc must have four characters";
    return false;
  }
  return true;
}

json config_to_json(const OrchestratorConfig& cfg) {
  return json{{"chunkDurationS", cfg.chunk_duration_s},
              {"overlapS", cfg.overlap_s},
              {"tau", cfg.tau},
              {"chunkMaxAttempts", cfg.chunk_max_attempts},
              {"chunkHeartbeatMs", cfg.chunk_heartbeat_ms},
              {"ioRetryAttempts", cfg.io_retry_attempts},
              {"ioBackoffBaseMs", cfg.io_backoff_base_ms},
              {"ioBackoffMaxMs", cfg.io_backoff_max_ms},
              {"redeliveryBackoffBaseMs", cfg.redelivery_backoff_base_ms},
              {"redeliveryBackoffMaxMs", cfg.redelivery_backoff_max_ms},
              {"visibilityTimeoutMs", cfg.visibility_timeout_ms},
              {"maxDeliver", cfg.max_deliver},
              {"reconcileIntervalMs", cfg.reconcile_interval_ms},
              {"ingestStaleMs", cfg.ingest_stale_ms},
              {"processingStaleMs", cfg.processing_stale_ms},
              {"stitchStaleMs", cfg.stitch_stale_ms},
              {"smoothingWindow", cfg.smoothing_window},
              {"detectorModel", cfg.detector_model},
              {"detectors", cfg.detectors},
              {"outputFourcc", cfg.output_fourcc},
              {"workerCount", cfg.worker_count},
              {"pollTimeoutMs", cfg.poll_timeout_ms},
              {"natsUrl", cfg.nats_url},
              {"kvBucket", cfg.kv_bucket},
              {"kvMemoryStorage", cfg.kv_memory_storage},
              {"taskStream", cfg.task_stream},
              {"subjectPrefix", cfg.subject_prefix},
              {"consumerDurable", cfg.consumer_durable},
              {"defaultNotifySubject", cfg.default_notify_subject},
              {"blobRoot", cfg.blob_root}};
}

}  // namespace vscrub::sdk
