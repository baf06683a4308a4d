#pragma once

#include <cstdint>

#include "vscrubsdk/job_state_store.h"
#include "vscrubsdk/task_dispatcher.h"

namespace vscrub::sdk {

// Periodic sweep that re-derives lost work from the store: tasks whose enqueue never
// happened (crash between a CAS and the publish) or that the queue dropped.
class Reconciler {
 public:
  struct Config {
    std::int64_t ingest_stale_ms = 120000;
    std::int64_t processing_stale_ms = 600000;
    std::int64_t stitch_stale_ms = 300000;
  };

  struct SweepStats {
    int jobs_scanned = 0;
    int ingest_enqueued = 0;
    int chunk_enqueued = 0;
    int stitch_enqueued = 0;
    int completions_recounted = 0;
  };

  Reconciler(Config cfg, JobStateStore* state, TaskDispatcher* dispatcher);

  SweepStats sweep(std::int64_t now);

 private:
  void sweep_processing(const Job& job, std::int64_t now, SweepStats& stats);

  Config cfg_;
  JobStateStore* state_ = nullptr;
  TaskDispatcher* dispatcher_ = nullptr;
};

}  // namespace vscrub::sdk
