#include "vscrubsdk/reconciler.h"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace vscrub::sdk {

Reconciler::Reconciler(Config cfg, JobStateStore* state, TaskDispatcher* dispatcher)
    : cfg_(cfg), state_(state), dispatcher_(dispatcher) {
  if (state_ == nullptr || dispatcher_ == nullptr) {
    throw std::invalid_argument("Reconciler requires state and dispatcher");
  }
}

void Reconciler::sweep_processing(const Job& job, std::int64_t now, SweepStats& stats) {
  for (const auto& chunk : state_->list_chunks(job.job_id)) {
    if (chunk.status == ChunkStatus::kDone) {
      // DONE but never counted: the worker died between the two CAS steps.
      if (!std::binary_search(job.completed_indices.begin(), job.completed_indices.end(), chunk.index)) {
        const CompletionResult r = state_->increment_and_check_completion(job.job_id, chunk.index);
        ++stats.completions_recounted;
        if (r.trigger_stitch && dispatcher_->enqueue_stitch(job.job_id)) {
          ++stats.stitch_enqueued;
        }
      }
      continue;
    }
    if (chunk.status == ChunkStatus::kFailed) {
      continue;
    }
    if (now - chunk.updated_at_ms >= cfg_.processing_stale_ms &&
        dispatcher_->enqueue_chunk(job.job_id, chunk.index, chunk.attempt_count)) {
      ++stats.chunk_enqueued;
    }
  }
}

Reconciler::SweepStats Reconciler::sweep(std::int64_t now) {
  SweepStats stats;
  for (const auto& job_id : state_->list_job_ids()) {
    const auto job = state_->get_job(job_id);
    if (!job.has_value()) continue;
    ++stats.jobs_scanned;
    const std::int64_t idle_ms = now - job->updated_at_ms;
    switch (job->status) {
      case JobStatus::kQueued:
      case JobStatus::kChunking:
        if (idle_ms >= cfg_.ingest_stale_ms && dispatcher_->enqueue_ingest(job_id)) {
          ++stats.ingest_enqueued;
        }
        break;
      case JobStatus::kProcessing:
        if (idle_ms >= cfg_.processing_stale_ms) {
          sweep_processing(*job, now, stats);
        }
        break;
      case JobStatus::kStitching:
        if (idle_ms >= cfg_.stitch_stale_ms && dispatcher_->enqueue_stitch(job_id)) {
          ++stats.stitch_enqueued;
        }
        break;
      case JobStatus::kCompleted:
      case JobStatus::kFailed:
        break;
    }
  }
  if (stats.ingest_enqueued + stats.chunk_enqueued + stats.stitch_enqueued + stats.completions_recounted > 0) {
    spdlog::info("reconcile sweep jobs={} ingest={} chunk={} stitch={} recounted={}", stats.jobs_scanned,
                 stats.ingest_enqueued, stats.chunk_enqueued, stats.stitch_enqueued, stats.completions_recounted);
  }
  return stats;
}

}  // namespace vscrub::sdk
