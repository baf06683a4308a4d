#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "vscrubcv/cascade_detector.h"
#include "vscrubcv/chunk_renderer.h"
#include "vscrubcv/image_renderer.h"
#include "vscrubcv/media.h"
#include "vscrubcv/video_stitcher.h"
#include "vscrubsdk/config.h"
#include "vscrubsdk/errors.h"
#include "vscrubsdk/fs_blob_store.h"
#include "vscrubsdk/jetstream_task_queue.h"
#include "vscrubsdk/job_api_server.h"
#include "vscrubsdk/kv_store.h"
#include "vscrubsdk/nats_client.h"
#include "vscrubsdk/notifier.h"
#include "vscrubsdk/orchestrator.h"
#include "vscrubsdk/time_utils.h"

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true, std::memory_order_release); }

void apply_overrides(const cxxopts::ParseResult& args, vscrub::sdk::OrchestratorConfig& cfg) {
  if (args.count("nats-url")) cfg.nats_url = args["nats-url"].as<std::string>();
  if (args.count("blob-root")) cfg.blob_root = args["blob-root"].as<std::string>();
  if (args.count("workers")) cfg.worker_count = args["workers"].as<int>();
  if (args.count("detector-model")) cfg.detector_model = args["detector-model"].as<std::string>();
  if (args.count("detector")) {
    for (const auto& entry : args["detector"].as<std::vector<std::string>>()) cfg.detectors.push_back(entry);
  }
  if (args.count("chunk-duration")) cfg.chunk_duration_s = args["chunk-duration"].as<double>();
  if (args.count("overlap")) cfg.overlap_s = args["overlap"].as<double>();
  if (args.count("tau")) cfg.tau = args["tau"].as<double>();
  if (args.count("notify-subject")) cfg.default_notify_subject = args["notify-subject"].as<std::string>();
  if (args.count("kv-memory")) cfg.kv_memory_storage = true;
}

}  // namespace

int main(int argc, char** argv) {
  cxxopts::Options options("vscrubd", "vscrub worker daemon: chunked video anonymization orchestrator");
  options.add_options()("config", "JSON config file", cxxopts::value<std::string>()->default_value(""))(
      "nats-url", "NATS server URL", cxxopts::value<std::string>())(
      "blob-root", "Blob store root directory", cxxopts::value<std::string>())(
      "workers", "Worker threads", cxxopts::value<int>())(
      "detector-model", "Cascade model file for the face detector", cxxopts::value<std::string>())(
      "detector", "Extra detector as label=model-path (repeatable)", cxxopts::value<std::vector<std::string>>())(
      "chunk-duration", "Chunk duration in seconds", cxxopts::value<double>())(
      "overlap", "Chunk overlap in seconds", cxxopts::value<double>())(
      "tau", "Identity match threshold (cosine similarity)", cxxopts::value<double>())(
      "notify-subject", "Default completion notification subject", cxxopts::value<std::string>())(
      "kv-memory", "Keep the job bucket in memory (testing)")(
      "print-config", "Print the effective config JSON and exit")(
      "log-level", "trace|debug|info|warn|error", cxxopts::value<std::string>()->default_value("info"))(
      "help", "Show help");

  cxxopts::ParseResult args;
  try {
    args = options.parse(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n" << options.help() << "\n";
    return 2;
  }
  if (args.count("help")) {
    std::cout << options.help() << "\n";
    return 0;
  }

  try {
    spdlog::set_default_logger(spdlog::stdout_color_mt("console"));
  } catch (const spdlog::spdlog_ex&) {
    // already registered
  }
  spdlog::set_level(spdlog::level::from_str(args["log-level"].as<std::string>()));
  spdlog::flush_on(spdlog::level::info);

  vscrub::sdk::OrchestratorConfig cfg;
  std::string err;
  const std::string config_path = args["config"].as<std::string>();
  if (!config_path.empty() && !vscrub::sdk::load_config_file(config_path, cfg, err)) {
    std::cerr << err << "\n";
    return 2;
  }
  apply_overrides(args, cfg);
  if (!vscrub::sdk::validate_config(cfg, err)) {
    std::cerr << "invalid config: " << err << "\n";
    return 2;
  }
  if (args.count("print-config")) {
    std::cout << vscrub::sdk::config_to_json(cfg).dump(1) << "\n";
    return 0;
  }
  if (cfg.detector_model.empty() && cfg.detectors.empty()) {
    std::cerr << "Missing --detector-model or --detector\n";
    return 2;
  }

  std::signal(SIGINT, &on_signal);
  std::signal(SIGTERM, &on_signal);

  vscrub::sdk::NatsClient client;
  vscrub::sdk::NatsClient::Options nats_opts;
  nats_opts.name = "vscrubd";
  if (!client.connect(cfg.nats_url, nats_opts)) {
    spdlog::error("cannot connect to NATS url={}", cfg.nats_url);
    return 1;
  }

  vscrub::sdk::KvStore records;
  vscrub::sdk::KvConfig kv_cfg;
  kv_cfg.bucket = cfg.kv_bucket;
  kv_cfg.memory_storage = cfg.kv_memory_storage;
  if (!records.open_or_create(client.jetstream(), kv_cfg)) {
    spdlog::error("cannot open job bucket bucket={}", cfg.kv_bucket);
    return 1;
  }

  vscrub::sdk::JetStreamTaskQueue::Config queue_cfg;
  queue_cfg.stream = cfg.task_stream;
  queue_cfg.subject_prefix = cfg.subject_prefix;
  queue_cfg.durable = cfg.consumer_durable;
  queue_cfg.ack_wait_ms = cfg.visibility_timeout_ms;
  queue_cfg.max_deliver = cfg.max_deliver;
  vscrub::sdk::JetStreamTaskQueue queue(queue_cfg, &client);
  if (!queue.start()) {
    return 1;
  }

  vscrub::sdk::FsBlobStore::Config blob_cfg;
  blob_cfg.root = cfg.blob_root;
  vscrub::sdk::FsBlobStore blobs(blob_cfg, &vscrub::vision::probe_duration);
  vscrub::sdk::OpError blob_err;
  if (!blobs.init(&blob_err)) {
    spdlog::error("blob store init failed: {}", blob_err.message);
    return 1;
  }

  vscrub::vision::CascadeDetectionTracker::Config det_cfg;
  try {
    det_cfg.models = vscrub::vision::cascade_models(cfg.detector_model, cfg.detectors);
    vscrub::vision::CascadeDetectionTracker check(det_cfg);
  } catch (const std::invalid_argument& ex) {
    std::cerr << ex.what() << "\n";
    return 2;
  } catch (const vscrub::sdk::ProcessingError& ex) {
    spdlog::error("detector setup failed: {}", ex.what());
    return 1;
  }
  vscrub::vision::OpenCvChunkPipeline::Config render_cfg;
  render_cfg.fourcc = cfg.output_fourcc;
  render_cfg.smoothing_window = cfg.smoothing_window;
  vscrub::vision::OpenCvChunkPipeline pipeline(render_cfg, vscrub::vision::make_cascade_factory(det_cfg));
  vscrub::vision::OpenCvImagePipeline images(vscrub::vision::OpenCvImagePipeline::Config{},
                                             vscrub::vision::make_cascade_factory(det_cfg));
  vscrub::vision::OpenCvConcatenator::Config concat_cfg;
  concat_cfg.fourcc = cfg.output_fourcc;
  vscrub::vision::OpenCvConcatenator concatenator(concat_cfg);
  vscrub::sdk::NatsJobNotifier notifier(&client, cfg.default_notify_subject);

  vscrub::sdk::Orchestrator engine(cfg, &records, &queue, &blobs, &pipeline, &concatenator, &notifier);
  engine.api().set_image_pipeline(&images);

  vscrub::sdk::JobApiServer::Config api_cfg;
  api_cfg.api_prefix = cfg.subject_prefix;
  vscrub::sdk::JobApiServer api_server(api_cfg, &client, &engine.api());
  if (!api_server.start()) {
    return 1;
  }

  engine.start_workers();
  spdlog::info("vscrubd started natsUrl={} workers={} bucket={} stream={}", cfg.nats_url, cfg.worker_count,
               cfg.kv_bucket, cfg.task_stream);

  std::int64_t next_sweep = vscrub::sdk::now_ms() + cfg.reconcile_interval_ms;
  while (!g_stop.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    const std::int64_t now = vscrub::sdk::now_ms();
    if (cfg.reconcile_interval_ms > 0 && now >= next_sweep) {
      engine.reconciler().sweep(now);
      next_sweep = now + cfg.reconcile_interval_ms;
    }
  }

  spdlog::info("vscrubd stopping");
  api_server.stop();
  engine.stop_workers();
  queue.stop();
  records.close();
  client.close();
  return 0;
}
