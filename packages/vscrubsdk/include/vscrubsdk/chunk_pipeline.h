#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vscrubsdk/job_model.h"

namespace vscrub::sdk {

struct ChunkRenderRequest {
  std::string job_id;
  int index = 0;
  std::string input_path;
  ChunkSpan span;

  // Overlap windows shared with the neighbours. Empty (begin == end) at the edges.
  double head_window_begin_s = 0.0;
  double head_window_end_s = 0.0;
  double tail_window_begin_s = 0.0;
  double tail_window_end_s = 0.0;

  std::string profile = "NONE";
  nlohmann::json options = nlohmann::json::object();

  // Polled between frames; returning true aborts with ErrorCode::kCancelled.
  std::function<bool()> should_abort;
  std::function<void()> keepalive;
};

struct ChunkRenderResult {
  std::vector<std::uint8_t> output_bytes;
  std::vector<TrackSummary> head_tracks;
  std::vector<TrackSummary> tail_tracks;
};

// Detect, track and anonymize one chunk. Throws ProcessingError classified by ErrorCode.
class ChunkPipeline {
 public:
  virtual ~ChunkPipeline() = default;
  virtual ChunkRenderResult render(const ChunkRenderRequest& request) = 0;
};

struct ImageRenderRequest {
  std::vector<std::uint8_t> input_bytes;
  // Encoder extension for the output, e.g. ".png" or ".jpg".
  std::string format = ".png";
  std::string profile = "NONE";
  nlohmann::json options = nlohmann::json::object();
};

struct ImageRenderResult {
  std::vector<std::uint8_t> output_bytes;
  int regions = 0;
};

// Detect and anonymize one still image. Throws ProcessingError classified by ErrorCode.
class ImagePipeline {
 public:
  virtual ~ImagePipeline() = default;
  virtual ImageRenderResult render(const ImageRenderRequest& request) = 0;
};

}  // namespace vscrub::sdk
