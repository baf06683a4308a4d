#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vscrub::sdk {

struct OrchestratorConfig {
  // Chunking.
  double chunk_duration_s = 60.0;
  double overlap_s = 5.0;

  // Identity continuity.
  double tau = 0.75;

  // Per-chunk retry budget (claims) and in-handler retries of transient I/O.
  int chunk_max_attempts = 3;
  // Interval at which an in-flight chunk refreshes its record; keep below processing_stale_ms.
  std::int64_t chunk_heartbeat_ms = 60000;
  int io_retry_attempts = 3;
  std::int64_t io_backoff_base_ms = 200;
  std::int64_t io_backoff_max_ms = 5000;

  // Redelivery backoff applied by the dispatcher on negative acknowledgment.
  std::int64_t redelivery_backoff_base_ms = 1000;
  std::int64_t redelivery_backoff_max_ms = 60000;
  std::int64_t visibility_timeout_ms = 120000;
  int max_deliver = 16;

  // Reconciler.
  std::int64_t reconcile_interval_ms = 60000;
  std::int64_t ingest_stale_ms = 120000;
  std::int64_t processing_stale_ms = 600000;
  std::int64_t stitch_stale_ms = 300000;

  // Rendering.
  int smoothing_window = 5;
  std::string detector_model;
  // Additional detectors as "label=model-path", e.g. "plate=/models/plate.xml".
  std::vector<std::string> detectors;
  std::string output_fourcc = "mp4v";

  // Workers.
  int worker_count = 2;
  std::int64_t poll_timeout_ms = 1000;

  // Transport.
  std::string nats_url = "nats://127.0.0.1:4222";
  std::string kv_bucket = "vscrub_jobs";
  bool kv_memory_storage = false;
  std::string task_stream = "VSCRUB_TASKS";
  std::string subject_prefix = "vscrub";
  std::string consumer_durable = "vscrub-workers";
  std::string default_notify_subject;
  std::string blob_root = "./vscrub-blobs";
};

// Overlays the keys present in `j` (camelCase) onto `cfg`.
bool apply_config_json(const nlohmann::json& j, OrchestratorConfig& cfg, std::string& err);
// Splits a "label=model-path" detector entry.
bool split_detector_entry(const std::string& entry, std::string& label, std::string& model);

bool load_config_file(const std::string& path, OrchestratorConfig& cfg, std::string& err);

bool validate_config(const OrchestratorConfig& cfg, std::string& err);
nlohmann::json config_to_json(const OrchestratorConfig& cfg);

}  // namespace vscrub::sdk
