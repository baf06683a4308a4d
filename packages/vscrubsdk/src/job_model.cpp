#include "vscrubsdk/job_model.h"

#include <algorithm>

namespace vscrub::sdk {

using json = nlohmann::json;

namespace {

bool read_string(const json& j, const char* key, std::string& out) {
  if (!j.contains(key)) return true;
  const auto& v = j[key];
  if (v.is_null()) return true;
  if (!v.is_string()) return false;
  out = v.get<std::string>();
  return true;
}

bool read_int(const json& j, const char* key, int& out) {
  if (!j.contains(key) || j[key].is_null()) return true;
  if (!j[key].is_number_integer()) return false;
  out = j[key].get<int>();
  return true;
}

bool read_i64(const json& j, const char* key, std::int64_t& out) {
  if (!j.contains(key) || j[key].is_null()) return true;
  if (!j[key].is_number_integer()) return false;
  out = j[key].get<std::int64_t>();
  return true;
}

bool read_double(const json& j, const char* key, double& out) {
  if (!j.contains(key) || j[key].is_null()) return true;
  if (!j[key].is_number()) return false;
  out = j[key].get<double>();
  return true;
}

json tracks_to_json(const std::vector<TrackSummary>& tracks) {
  json arr = json::array();
  for (const auto& t : tracks) {
    arr.push_back(track_summary_to_json(t));
  }
  return arr;
}

bool tracks_from_json(const json& j, const char* key, std::vector<TrackSummary>& out, std::string& err) {
  out.clear();
  if (!j.contains(key) || j[key].is_null()) return true;
  if (!j[key].is_array()) {
    err = std::string(key) + " must be an array";
    return false;
  }
  for (const auto& item : j[key]) {
    TrackSummary t;
    if (!track_summary_from_json(item, t, err)) {
      return false;
    }
    out.push_back(std::move(t));
  }
  return true;
}

}  // namespace

const char* to_string(JobStatus status) {
  switch (status) {
    case JobStatus::kQueued:
      return "QUEUED";
    case JobStatus::kChunking:
      return "CHUNKING";
    case JobStatus::kProcessing:
      return "PROCESSING";
    case JobStatus::kStitching:
      return "STITCHING";
    case JobStatus::kCompleted:
      return "COMPLETED";
    case JobStatus::kFailed:
      return "FAILED";
  }
  return "FAILED";
}

const char* to_string(ChunkStatus status) {
  switch (status) {
    case ChunkStatus::kPending:
      return "PENDING";
    case ChunkStatus::kProcessing:
      return "PROCESSING";
    case ChunkStatus::kDone:
      return "DONE";
    case ChunkStatus::kFailed:
      return "FAILED";
  }
  return "FAILED";
}

bool parse_job_status(const std::string& text, JobStatus& out) {
  static constexpr JobStatus kAll[] = {JobStatus::kQueued,    JobStatus::kChunking,  JobStatus::kProcessing,
                                       JobStatus::kStitching, JobStatus::kCompleted, JobStatus::kFailed};
  for (const JobStatus s : kAll) {
    if (text == to_string(s)) {
      out = s;
      return true;
    }
  }
  return false;
}

bool parse_chunk_status(const std::string& text, ChunkStatus& out) {
  static constexpr ChunkStatus kAll[] = {ChunkStatus::kPending, ChunkStatus::kProcessing, ChunkStatus::kDone,
                                         ChunkStatus::kFailed};
  for (const ChunkStatus s : kAll) {
    if (text == to_string(s)) {
      out = s;
      return true;
    }
  }
  return false;
}

bool is_terminal(JobStatus status) { return status == JobStatus::kCompleted || status == JobStatus::kFailed; }

bool job_transition_allowed(JobStatus from, JobStatus to) {
  if (is_terminal(from)) return false;
  if (to == JobStatus::kFailed) return true;
  switch (from) {
    case JobStatus::kQueued:
      return to == JobStatus::kChunking;
    case JobStatus::kChunking:
      return to == JobStatus::kProcessing;
    case JobStatus::kProcessing:
      return to == JobStatus::kStitching;
    case JobStatus::kStitching:
      return to == JobStatus::kCompleted;
    default:
      return false;
  }
}

bool chunk_transition_allowed(ChunkStatus from, ChunkStatus to) {
  switch (from) {
    case ChunkStatus::kPending:
      return to == ChunkStatus::kProcessing || to == ChunkStatus::kDone || to == ChunkStatus::kFailed;
    case ChunkStatus::kProcessing:
      // PROCESSING -> PENDING releases a chunk after a retryable failure.
      return to == ChunkStatus::kPending || to == ChunkStatus::kDone || to == ChunkStatus::kFailed;
    default:
      return false;
  }
}

json bbox_to_json(const BBox& box) { return json::array({box.x, box.y, box.w, box.h}); }

bool bbox_from_json(const json& j, BBox& out) {
  if (!j.is_array() || j.size() != 4) return false;
  for (const auto& v : j) {
    if (!v.is_number()) return false;
  }
  out.x = j[0].get<float>();
  out.y = j[1].get<float>();
  out.w = j[2].get<float>();
  out.h = j[3].get<float>();
  return true;
}

json track_summary_to_json(const TrackSummary& track) {
  json j;
  j["localTrackId"] = track.local_track_id;
  j["classLabel"] = track.class_label;
  j["embedding"] = track.embedding;
  j["lastBbox"] = bbox_to_json(track.last_bbox);
  j["lastFrameOffset"] = track.last_frame_offset_in_window;
  return j;
}

bool track_summary_from_json(const json& j, TrackSummary& out, std::string& err) {
  if (!j.is_object()) {
    err = "track summary must be an object";
    return false;
  }
  if (!j.contains("localTrackId") || !j["localTrackId"].is_number_integer()) {
    err = "track summary requires integer localTrackId";
    return false;
  }
  out.local_track_id = j["localTrackId"].get<std::int64_t>();
  if (!read_string(j, "classLabel", out.class_label)) {
    err = "classLabel must be a string";
    return false;
  }
  out.embedding.clear();
  if (j.contains("embedding") && j["embedding"].is_array()) {
    for (const auto& v : j["embedding"]) {
      if (!v.is_number()) {
        err = "embedding must contain numbers";
        return false;
      }
      out.embedding.push_back(v.get<float>());
    }
  }
  if (j.contains("lastBbox") && !bbox_from_json(j["lastBbox"], out.last_bbox)) {
    err = "lastBbox must be [x, y, w, h]";
    return false;
  }
  if (!read_int(j, "lastFrameOffset", out.last_frame_offset_in_window)) {
    err = "lastFrameOffset must be an integer";
    return false;
  }
  return true;
}

json job_error_to_json(const JobError& error) {
  json j;
  j["code"] = to_string(error.code);
  j["message"] = error.message;
  if (error.chunk_index.has_value()) {
    j["chunkIndex"] = *error.chunk_index;
  }
  return j;
}

bool job_error_from_json(const json& j, JobError& out) {
  if (!j.is_object()) return false;
  std::string code;
  if (!read_string(j, "code", code) || !parse_error_code(code, out.code)) {
    out.code = ErrorCode::kInternal;
  }
  if (!read_string(j, "message", out.message)) return false;
  out.chunk_index.reset();
  if (j.contains("chunkIndex") && j["chunkIndex"].is_number_integer()) {
    out.chunk_index = j["chunkIndex"].get<int>();
  }
  return true;
}

json job_to_json(const Job& job) {
  json j;
  j["jobId"] = job.job_id;
  j["status"] = to_string(job.status);
  j["inputRef"] = job.input_ref;
  j["outputRef"] = job.output_ref;
  j["chunkCount"] = job.chunk_count.has_value() ? json(*job.chunk_count) : json(nullptr);
  j["chunksCompleted"] = job.chunks_completed;
  j["completedIndices"] = job.completed_indices;
  j["error"] = job.error.has_value() ? job_error_to_json(*job.error) : json(nullptr);
  j["durationS"] = job.duration_s;
  j["profile"] = job.profile;
  j["options"] = job.options.is_object() ? job.options : json::object();
  j["notifySubject"] = job.notify_subject;
  j["identityMapRef"] = job.identity_map_ref;
  j["createdAt"] = job.created_at_ms;
  j["updatedAt"] = job.updated_at_ms;
  return j;
}

bool job_from_json(const json& j, Job& out, std::string& err) {
  if (!j.is_object()) {
    err = "job record must be an object";
    return false;
  }
  if (!read_string(j, "jobId", out.job_id) || out.job_id.empty()) {
    err = "job record requires jobId";
    return false;
  }
  std::string status;
  if (!read_string(j, "status", status) || !parse_job_status(status, out.status)) {
    err = "job record has invalid status '" + status + "'";
    return false;
  }
  if (!read_string(j, "inputRef", out.input_ref) || !read_string(j, "outputRef", out.output_ref) ||
      !read_string(j, "profile", out.profile) || !read_string(j, "notifySubject", out.notify_subject) ||
      !read_string(j, "identityMapRef", out.identity_map_ref)) {
    err = "job record has a non-string reference field";
    return false;
  }
  out.chunk_count.reset();
  if (j.contains("chunkCount") && !j["chunkCount"].is_null()) {
    if (!j["chunkCount"].is_number_integer()) {
      err = "chunkCount must be an integer";
      return false;
    }
    out.chunk_count = j["chunkCount"].get<int>();
  }
  if (!read_int(j, "chunksCompleted", out.chunks_completed) || !read_double(j, "durationS", out.duration_s) ||
      !read_i64(j, "createdAt", out.created_at_ms) || !read_i64(j, "updatedAt", out.updated_at_ms)) {
    err = "job record has a non-numeric counter";
    return false;
  }
  out.completed_indices.clear();
  if (j.contains("completedIndices") && j["completedIndices"].is_array()) {
    for (const auto& v : j["completedIndices"]) {
      if (!v.is_number_integer()) {
        err = "completedIndices must contain integers";
        return false;
      }
      out.completed_indices.push_back(v.get<int>());
    }
    std::sort(out.completed_indices.begin(), out.completed_indices.end());
  }
  out.error.reset();
  if (j.contains("error") && j["error"].is_object()) {
    JobError e;
    if (job_error_from_json(j["error"], e)) {
      out.error = e;
    }
  }
  out.options = (j.contains("options") && j["options"].is_object()) ? j["options"] : json::object();
  return true;
}

json chunk_to_json(const Chunk& chunk) {
  json j;
  j["jobId"] = chunk.job_id;
  j["index"] = chunk.index;
  j["status"] = to_string(chunk.status);
  j["inputRef"] = chunk.input_ref;
  j["outputRef"] = chunk.output_ref;
  j["attemptCount"] = chunk.attempt_count;
  j["startS"] = chunk.span.start_s;
  j["endS"] = chunk.span.end_s;
  j["coreStartS"] = chunk.span.core_start_s;
  j["coreEndS"] = chunk.span.core_end_s;
  j["headTracks"] = tracks_to_json(chunk.head_tracks);
  j["boundaryTracks"] = tracks_to_json(chunk.boundary_tracks);
  j["error"] = chunk.error.has_value() ? job_error_to_json(*chunk.error) : json(nullptr);
  j["updatedAt"] = chunk.updated_at_ms;
  return j;
}

bool chunk_from_json(const json& j, Chunk& out, std::string& err) {
  if (!j.is_object()) {
    err = "chunk record must be an object";
    return false;
  }
  if (!read_string(j, "jobId", out.job_id) || out.job_id.empty()) {
    err = "chunk record requires jobId";
    return false;
  }
  if (!j.contains("index") || !j["index"].is_number_integer()) {
    err = "chunk record requires integer index";
    return false;
  }
  out.index = j["index"].get<int>();
  out.span.index = out.index;
  std::string status;
  if (!read_string(j, "status", status) || !parse_chunk_status(status, out.status)) {
    err = "chunk record has invalid status '" + status + "'";
    return false;
  }
  if (!read_string(j, "inputRef", out.input_ref) || !read_string(j, "outputRef", out.output_ref)) {
    err = "chunk record has a non-string reference field";
    return false;
  }
  if (!read_int(j, "attemptCount", out.attempt_count) || !read_double(j, "startS", out.span.start_s) ||
      !read_double(j, "endS", out.span.end_s) || !read_double(j, "coreStartS", out.span.core_start_s) ||
      !read_double(j, "coreEndS", out.span.core_end_s) || !read_i64(j, "updatedAt", out.updated_at_ms)) {
    err = "chunk record has a non-numeric field";
    return false;
  }
  if (!tracks_from_json(j, "headTracks", out.head_tracks, err) ||
      !tracks_from_json(j, "boundaryTracks", out.boundary_tracks, err)) {
    return false;
  }
  out.error.reset();
  if (j.contains("error") && j["error"].is_object()) {
    JobError e;
    if (job_error_from_json(j["error"], e)) {
      out.error = e;
    }
  }
  return true;
}

}  // namespace vscrub::sdk
