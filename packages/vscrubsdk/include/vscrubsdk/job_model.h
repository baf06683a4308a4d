#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vscrubsdk/errors.h"

namespace vscrub::sdk {

enum class JobStatus : std::uint8_t {
  kQueued,
  kChunking,
  kProcessing,
  kStitching,
  kCompleted,
  kFailed,
};

enum class ChunkStatus : std::uint8_t {
  kPending,
  kProcessing,
  kDone,
  kFailed,
};

const char* to_string(JobStatus status);
const char* to_string(ChunkStatus status);
bool parse_job_status(const std::string& text, JobStatus& out);
bool parse_chunk_status(const std::string& text, ChunkStatus& out);

bool is_terminal(JobStatus status);

// Forward edges of the job state machine. Every non-terminal state may also move to FAILED.
bool job_transition_allowed(JobStatus from, JobStatus to);
bool chunk_transition_allowed(ChunkStatus from, ChunkStatus to);

struct BBox {
  float x = 0.0f;
  float y = 0.0f;
  float w = 0.0f;
  float h = 0.0f;
};

// Last observation of a locally tracked entity inside an overlap window.
struct TrackSummary {
  std::int64_t local_track_id = 0;
  std::string class_label;
  std::vector<float> embedding;
  BBox last_bbox;
  int last_frame_offset_in_window = 0;
};

// Structured, user-visible failure cause.
struct JobError {
  ErrorCode code = ErrorCode::kInternal;
  std::string message;
  std::optional<int> chunk_index;
};

// Time span of one chunk. [start_s, end_s) includes the overlap carried into the
// neighbours; [core_start_s, core_end_s) is the part rendered into the output.
struct ChunkSpan {
  int index = 0;
  double start_s = 0.0;
  double end_s = 0.0;
  double core_start_s = 0.0;
  double core_end_s = 0.0;
};

struct Job {
  std::string job_id;
  JobStatus status = JobStatus::kQueued;
  std::string input_ref;
  std::string output_ref;
  std::optional<int> chunk_count;
  int chunks_completed = 0;
  std::vector<int> completed_indices;
  std::optional<JobError> error;
  double duration_s = 0.0;

  std::string profile = "NONE";
  nlohmann::json options = nlohmann::json::object();
  std::string notify_subject;
  std::string identity_map_ref;

  std::int64_t created_at_ms = 0;
  std::int64_t updated_at_ms = 0;
};

struct Chunk {
  std::string job_id;
  int index = 0;
  ChunkStatus status = ChunkStatus::kPending;
  std::string input_ref;
  std::string output_ref;
  int attempt_count = 0;
  ChunkSpan span;
  std::vector<TrackSummary> head_tracks;
  std::vector<TrackSummary> boundary_tracks;  // tail overlap window, written on DONE
  std::optional<JobError> error;
  std::int64_t updated_at_ms = 0;
};

// Result written atomically with the DONE transition.
struct ChunkResult {
  std::string output_ref;
  std::vector<TrackSummary> head_tracks;
  std::vector<TrackSummary> tail_tracks;
};

nlohmann::json bbox_to_json(const BBox& box);
bool bbox_from_json(const nlohmann::json& j, BBox& out);

nlohmann::json track_summary_to_json(const TrackSummary& track);
bool track_summary_from_json(const nlohmann::json& j, TrackSummary& out, std::string& err);

nlohmann::json job_error_to_json(const JobError& error);
bool job_error_from_json(const nlohmann::json& j, JobError& out);

nlohmann::json job_to_json(const Job& job);
bool job_from_json(const nlohmann::json& j, Job& out, std::string& err);

nlohmann::json chunk_to_json(const Chunk& chunk);
bool chunk_from_json(const nlohmann::json& j, Chunk& out, std::string& err);

}  // namespace vscrub::sdk
