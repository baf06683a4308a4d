#include "vscrubsdk/orchestrator.h"

namespace vscrub::sdk {

namespace {

TaskDispatcher::Config dispatcher_config(const OrchestratorConfig& c) {
  TaskDispatcher::Config out;
  out.redelivery_backoff_base_ms = c.redelivery_backoff_base_ms;
  out.redelivery_backoff_max_ms = c.redelivery_backoff_max_ms;
  return out;
}

IngestionCoordinator::Config ingestion_config(const OrchestratorConfig& c) {
  IngestionCoordinator::Config out;
  out.chunk_duration_s = c.chunk_duration_s;
  out.overlap_s = c.overlap_s;
  out.io_retry_attempts = c.io_retry_attempts;
  out.io_backoff_base_ms = c.io_backoff_base_ms;
  out.io_backoff_max_ms = c.io_backoff_max_ms;
  return out;
}

ChunkHandler::Config chunk_config(const OrchestratorConfig& c) {
  ChunkHandler::Config out;
  out.max_attempts = c.chunk_max_attempts;
  out.heartbeat_ms = c.chunk_heartbeat_ms;
  out.overlap_s = c.overlap_s;
  out.io_retry_attempts = c.io_retry_attempts;
  out.io_backoff_base_ms = c.io_backoff_base_ms;
  out.io_backoff_max_ms = c.io_backoff_max_ms;
  return out;
}

StitchCoordinator::Config stitch_config(const OrchestratorConfig& c) {
  StitchCoordinator::Config out;
  out.tau = c.tau;
  out.io_retry_attempts = c.io_retry_attempts;
  out.io_backoff_base_ms = c.io_backoff_base_ms;
  out.io_backoff_max_ms = c.io_backoff_max_ms;
  return out;
}

Reconciler::Config reconciler_config(const OrchestratorConfig& c) {
  Reconciler::Config out;
  out.ingest_stale_ms = c.ingest_stale_ms;
  out.processing_stale_ms = c.processing_stale_ms;
  out.stitch_stale_ms = c.stitch_stale_ms;
  return out;
}

}  // namespace

Orchestrator::Orchestrator(const OrchestratorConfig& cfg, RecordStore* records, TaskQueue* queue, BlobStore* blobs,
                           ChunkPipeline* pipeline, VideoConcatenator* concatenator, JobNotifier* notifier)
    : cfg_(cfg),
      state_(records),
      dispatcher_(dispatcher_config(cfg), queue),
      ingestion_(ingestion_config(cfg), &state_, blobs, &dispatcher_, notifier),
      chunks_(chunk_config(cfg), &state_, blobs, pipeline, &dispatcher_, notifier),
      stitcher_(stitch_config(cfg), &state_, blobs, concatenator, notifier),
      reconciler_(reconciler_config(cfg), &state_, &dispatcher_),
      api_(&state_, &dispatcher_, blobs, notifier) {
  dispatcher_.set_handler(TaskKind::kIngest,
                          [this](const Task& t, const TaskContext& ctx) { return ingestion_.handle(t, ctx); });
  dispatcher_.set_handler(TaskKind::kChunk,
                          [this](const Task& t, const TaskContext& ctx) { return chunks_.handle(t, ctx); });
  dispatcher_.set_handler(TaskKind::kStitch,
                          [this](const Task& t, const TaskContext& ctx) { return stitcher_.handle(t, ctx); });
}

Orchestrator::~Orchestrator() { stop_workers(); }

void Orchestrator::start_workers() {
  if (workers_) return;
  workers_ = std::make_unique<WorkerPool>(&dispatcher_, cfg_.worker_count, cfg_.poll_timeout_ms);
  workers_->start();
}

void Orchestrator::stop_workers() {
  if (!workers_) return;
  workers_->stop();
  workers_.reset();
}

}  // namespace vscrub::sdk
