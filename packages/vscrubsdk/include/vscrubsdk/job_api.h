#pragma once

#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "vscrubsdk/blob_store.h"
#include "vscrubsdk/chunk_pipeline.h"
#include "vscrubsdk/job_state_store.h"
#include "vscrubsdk/notifier.h"
#include "vscrubsdk/task_dispatcher.h"

namespace vscrub::sdk {

// User-facing job summary returned by getJob.
struct JobView {
  std::string job_id;
  JobStatus status = JobStatus::kQueued;
  int chunks_completed = 0;
  std::optional<int> chunk_count;
  std::string output_ref;
  std::string identity_map_ref;
  std::optional<JobError> error;
  std::string profile;
  std::int64_t created_at_ms = 0;
  std::int64_t updated_at_ms = 0;
};

// Result of a synchronous image anonymization.
struct ImageView {
  std::string output_ref;
  int regions = 0;
};

// Blob scope holding anonymized images; they belong to no job.
inline constexpr const char* kImageScope = "images";

JobView make_job_view(const Job& job);
nlohmann::json job_view_to_json(const JobView& view);

// Operations exposed by the daemon endpoints and the CLI.
class JobApi {
 public:
  JobApi(JobStateStore* state, TaskDispatcher* dispatcher, BlobStore* blobs, JobNotifier* notifier = nullptr);

  // Creates the job and dispatches INGEST. A failed dispatch leaves the job QUEUED
  // for the reconciler; the id is still returned.
  std::optional<std::string> create_job(const NewJob& request, OpError* err = nullptr);

  std::optional<JobView> get_job(const std::string& job_id, OpError* err = nullptr) const;

  // Fails a non-terminal job with CANCELLED. In-flight handlers stop at their next store access.
  bool cancel_job(const std::string& job_id, OpError* err = nullptr);

  // Cancels if needed, then removes the records and blobs of the job. Blobs that
  // another job still references (a shared input, an output reused as input) are kept.
  bool delete_job(const std::string& job_id, OpError* err = nullptr);

  // FAILED during stitching -> STITCHING, then dispatches STITCH.
  bool retry_stitch(const std::string& job_id, OpError* err = nullptr);

  // Anonymizes the image at `input_ref` in the caller's thread and stores the result
  // under kImageScope. `format` picks the encoder (".png", ".jpg").
  std::optional<ImageView> anonymize_image(const std::string& input_ref, const std::string& format,
                                           const std::string& profile, const nlohmann::json& options,
                                           OpError* err = nullptr);

  void set_image_pipeline(ImagePipeline* images) { images_ = images; }

 private:
  // Input, output and identity map refs of every job other than `job_id`.
  bool collect_foreign_refs(const std::string& job_id, std::set<std::string>& out) const;

  JobStateStore* state_ = nullptr;
  TaskDispatcher* dispatcher_ = nullptr;
  BlobStore* blobs_ = nullptr;
  JobNotifier* notifier_ = nullptr;
  ImagePipeline* images_ = nullptr;
};

}  // namespace vscrub::sdk
