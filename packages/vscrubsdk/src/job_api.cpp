#include "vscrubsdk/job_api.h"

#include <exception>
#include <set>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

namespace vscrub::sdk {

using json = nlohmann::json;

namespace {

const std::set<std::string>& known_profiles() {
  static const std::set<std::string> kProfiles{"NONE", "GDPR", "CCPA", "HIPAA_SAFE_HARBOR"};
  return kProfiles;
}

bool valid_job_id(const std::string& job_id, OpError* err) {
  if (job_id.empty() || job_id.find_first_of(".*> \t") != std::string::npos) {
    set_error(err, ErrorCode::kInvalidArgument, "invalid job id");
    return false;
  }
  return true;
}

}  // namespace

JobView make_job_view(const Job& job) {
  JobView v;
  v.job_id = job.job_id;
  v.status = job.status;
  v.chunks_completed = job.chunks_completed;
  v.chunk_count = job.chunk_count;
  v.output_ref = job.output_ref;
  v.identity_map_ref = job.identity_map_ref;
  v.error = job.error;
  v.profile = job.profile;
  v.created_at_ms = job.created_at_ms;
  v.updated_at_ms = job.updated_at_ms;
  return v;
}

json job_view_to_json(const JobView& view) {
  json j;
  j["jobId"] = view.job_id;
  j["status"] = to_string(view.status);
  j["progress"] = json{{"chunksCompleted", view.chunks_completed},
                       {"chunkCount", view.chunk_count.has_value() ? json(*view.chunk_count) : json(nullptr)}};
  j["outputRef"] = view.output_ref.empty() ? json(nullptr) : json(view.output_ref);
  j["identityMapRef"] = view.identity_map_ref.empty() ? json(nullptr) : json(view.identity_map_ref);
  j["error"] = view.error.has_value() ? job_error_to_json(*view.error) : json(nullptr);
  j["profile"] = view.profile;
  j["createdAt"] = view.created_at_ms;
  j["updatedAt"] = view.updated_at_ms;
  return j;
}

JobApi::JobApi(JobStateStore* state, TaskDispatcher* dispatcher, BlobStore* blobs, JobNotifier* notifier)
    : state_(state), dispatcher_(dispatcher), blobs_(blobs), notifier_(notifier) {
  if (state_ == nullptr || dispatcher_ == nullptr || blobs_ == nullptr) {
    throw std::invalid_argument("JobApi requires state, dispatcher and blobs");
  }
}

std::optional<std::string> JobApi::create_job(const NewJob& request, OpError* err) {
  if (request.input_ref.empty()) {
    set_error(err, ErrorCode::kInvalidArgument, "inputRef is required");
    return std::nullopt;
  }
  if (known_profiles().count(request.profile) == 0) {
    set_error(err, ErrorCode::kInvalidArgument, "unknown profile " + request.profile);
    return std::nullopt;
  }
  if (!request.options.is_object()) {
    set_error(err, ErrorCode::kInvalidArgument, "options must be an object");
    return std::nullopt;
  }
  auto job = state_->create_job(request, err);
  if (!job.has_value()) {
    return std::nullopt;
  }
  std::string enqueue_err;
  if (!dispatcher_->enqueue_ingest(job->job_id, &enqueue_err)) {
    spdlog::warn("ingest dispatch deferred to reconciler jobId={} err={}", job->job_id, enqueue_err);
  }
  return job->job_id;
}

std::optional<JobView> JobApi::get_job(const std::string& job_id, OpError* err) const {
  if (!valid_job_id(job_id, err)) return std::nullopt;
  Job job;
  const StoreStatus s = state_->load_job(job_id, job);
  if (s == StoreStatus::kNotFound) {
    set_error(err, ErrorCode::kNotFound, "job not found: " + job_id);
    return std::nullopt;
  }
  if (s != StoreStatus::kOk) {
    set_error(err, ErrorCode::kTransientIo, "record store unavailable");
    return std::nullopt;
  }
  return make_job_view(job);
}

bool JobApi::cancel_job(const std::string& job_id, OpError* err) {
  if (!valid_job_id(job_id, err)) return false;
  JobError cause;
  cause.code = ErrorCode::kCancelled;
  cause.message = "cancelled by request";
  switch (state_->fail_job(job_id, cause)) {
    case TransitionResult::kApplied:
      spdlog::info("job cancelled jobId={}", job_id);
      if (notifier_ != nullptr) {
        if (auto job = state_->get_job(job_id)) notifier_->job_finished(*job);
      }
      return true;
    case TransitionResult::kStale:
      set_error(err, ErrorCode::kStaleTransition, "job already finished");
      return false;
    case TransitionResult::kNotFound:
      set_error(err, ErrorCode::kNotFound, "job not found: " + job_id);
      return false;
    case TransitionResult::kStoreError:
      break;
  }
  set_error(err, ErrorCode::kTransientIo, "record store unavailable");
  return false;
}

bool JobApi::delete_job(const std::string& job_id, OpError* err) {
  if (!valid_job_id(job_id, err)) return false;
  Job job;
  const StoreStatus js = state_->load_job(job_id, job);
  if (js == StoreStatus::kNotFound) {
    set_error(err, ErrorCode::kNotFound, "job not found: " + job_id);
    return false;
  }
  if (js != StoreStatus::kOk) {
    set_error(err, ErrorCode::kTransientIo, "record store unavailable");
    return false;
  }
  if (!is_terminal(job.status)) {
    OpError cancel_err;
    if (!cancel_job(job_id, &cancel_err) && cancel_err.code != ErrorCode::kStaleTransition) {
      if (err != nullptr) *err = cancel_err;
      return false;
    }
  }

  std::set<std::string> refs;
  refs.insert(job.input_ref);
  if (!job.output_ref.empty()) refs.insert(job.output_ref);
  if (!job.identity_map_ref.empty()) refs.insert(job.identity_map_ref);
  std::vector<Chunk> chunks;
  if (state_->load_chunks(job_id, chunks) == StoreStatus::kError) {
    set_error(err, ErrorCode::kTransientIo, "chunk records unavailable");
    return false;
  }
  for (const auto& chunk : chunks) {
    if (!chunk.output_ref.empty()) refs.insert(chunk.output_ref);
  }

  std::set<std::string> in_use;
  if (!collect_foreign_refs(job_id, in_use)) {
    set_error(err, ErrorCode::kTransientIo, "record store unavailable while checking shared blobs");
    return false;
  }

  int removed = 0;
  bool scope_in_use = false;
  for (const auto& ref : refs) {
    if (in_use.count(ref) != 0) {
      spdlog::info("blob kept, referenced by another job jobId={} ref={}", job_id, ref);
      scope_in_use = scope_in_use || blob_ref_scope(ref) == job_id;
      continue;
    }
    OpError blob_err;
    if (!blobs_->remove(ref, &blob_err)) {
      spdlog::warn("blob erase failed jobId={} ref={} err={}", job_id, ref, blob_err.message);
      set_error(err, blob_err.code, "blob erase failed: " + blob_err.message);
      return false;
    }
    ++removed;
  }
  if (!scope_in_use && valid_blob_scope(job_id)) {
    OpError blob_err;
    if (!blobs_->remove_scope(job_id, &blob_err)) {
      set_error(err, blob_err.code, "blob erase failed: " + blob_err.message);
      return false;
    }
  }
  if (!state_->erase_job(job_id)) {
    set_error(err, ErrorCode::kTransientIo, "record erase failed");
    return false;
  }
  spdlog::info("job erased jobId={} blobs={} kept={}", job_id, removed, static_cast<int>(refs.size()) - removed);
  return true;
}

bool JobApi::collect_foreign_refs(const std::string& job_id, std::set<std::string>& out) const {
  std::vector<std::string> ids;
  if (state_->load_job_ids(ids) != StoreStatus::kOk) {
    return false;
  }
  for (const auto& id : ids) {
    if (id == job_id) continue;
    Job other;
    const StoreStatus s = state_->load_job(id, other);
    if (s == StoreStatus::kNotFound) continue;
    if (s != StoreStatus::kOk) return false;
    out.insert(other.input_ref);
    if (!other.output_ref.empty()) out.insert(other.output_ref);
    if (!other.identity_map_ref.empty()) out.insert(other.identity_map_ref);
  }
  return true;
}

bool JobApi::retry_stitch(const std::string& job_id, OpError* err) {
  if (!valid_job_id(job_id, err)) return false;
  switch (state_->reset_failed_stitch(job_id)) {
    case TransitionResult::kApplied:
      break;
    case TransitionResult::kStale:
      set_error(err, ErrorCode::kStaleTransition, "job is not a failed stitch with all chunks completed");
      return false;
    case TransitionResult::kNotFound:
      set_error(err, ErrorCode::kNotFound, "job not found: " + job_id);
      return false;
    case TransitionResult::kStoreError:
      set_error(err, ErrorCode::kTransientIo, "record store unavailable");
      return false;
  }
  std::string enqueue_err;
  if (!dispatcher_->enqueue_stitch(job_id, &enqueue_err)) {
    spdlog::warn("stitch dispatch deferred to reconciler jobId={} err={}", job_id, enqueue_err);
  }
  spdlog::info("stitch retry requested jobId={}", job_id);
  return true;
}

std::optional<ImageView> JobApi::anonymize_image(const std::string& input_ref, const std::string& format,
                                                 const std::string& profile, const json& options, OpError* err) {
  if (images_ == nullptr) {
    set_error(err, ErrorCode::kInvalidArgument, "image anonymization is not enabled");
    return std::nullopt;
  }
  if (input_ref.empty()) {
    set_error(err, ErrorCode::kInvalidArgument, "inputRef is required");
    return std::nullopt;
  }
  if (known_profiles().count(profile) == 0) {
    set_error(err, ErrorCode::kInvalidArgument, "unknown profile " + profile);
    return std::nullopt;
  }
  if (!options.is_object()) {
    set_error(err, ErrorCode::kInvalidArgument, "options must be an object");
    return std::nullopt;
  }
  if (format != ".png" && format != ".jpg") {
    set_error(err, ErrorCode::kInvalidArgument, "format must be .png or .jpg");
    return std::nullopt;
  }

  ImageRenderRequest req;
  req.format = format;
  req.profile = profile;
  req.options = options;
  if (!blobs_->get(input_ref, req.input_bytes, err)) {
    return std::nullopt;
  }

  ImageRenderResult rendered;
  try {
    rendered = images_->render(req);
  } catch (const ProcessingError& ex) {
    set_error(err, ex.code(), ex.what());
    return std::nullopt;
  } catch (const std::exception& ex) {
    set_error(err, ErrorCode::kInternal, ex.what());
    return std::nullopt;
  }

  ImageView view;
  view.regions = rendered.regions;
  if (!blobs_->put(kImageScope, rendered.output_bytes, view.output_ref, err)) {
    return std::nullopt;
  }
  spdlog::info("image anonymized inputRef={} outputRef={} regions={} profile={}", input_ref, view.output_ref,
               view.regions, profile);
  return view;
}

}  // namespace vscrub::sdk
