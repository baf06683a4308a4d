#pragma once

#include <memory>

#include "vscrubsdk/chunk_handler.h"
#include "vscrubsdk/config.h"
#include "vscrubsdk/ingestion_coordinator.h"
#include "vscrubsdk/job_api.h"
#include "vscrubsdk/job_state_store.h"
#include "vscrubsdk/reconciler.h"
#include "vscrubsdk/stitch_coordinator.h"
#include "vscrubsdk/task_dispatcher.h"
#include "vscrubsdk/worker_pool.h"

namespace vscrub::sdk {

// Wires the engine components over externally owned substrates and registers the
// INGEST / CHUNK / STITCH handlers on the dispatcher.
class Orchestrator {
 public:
  Orchestrator(const OrchestratorConfig& cfg, RecordStore* records, TaskQueue* queue, BlobStore* blobs,
               ChunkPipeline* pipeline, VideoConcatenator* concatenator, JobNotifier* notifier = nullptr);
  ~Orchestrator();

  void start_workers();
  void stop_workers();

  JobStateStore& state() { return state_; }
  TaskDispatcher& dispatcher() { return dispatcher_; }
  JobApi& api() { return api_; }
  Reconciler& reconciler() { return reconciler_; }

 private:
  OrchestratorConfig cfg_;
  JobStateStore state_;
  TaskDispatcher dispatcher_;
  IngestionCoordinator ingestion_;
  ChunkHandler chunks_;
  StitchCoordinator stitcher_;
  Reconciler reconciler_;
  JobApi api_;
  std::unique_ptr<WorkerPool> workers_;
};

}  // namespace vscrub::sdk
