#pragma once

#include <string>

#include "vscrubcv/detection.h"
#include "vscrubsdk/chunk_pipeline.h"

namespace vscrub::vision {

// OpenCV chunk pipeline: decodes the chunk span, runs a fresh detection tracker
// over every frame (overlap included), anonymizes and encodes the core span and
// summarizes the tracks seen in the head and tail overlap windows.
class OpenCvChunkPipeline final : public sdk::ChunkPipeline {
 public:
  struct Config {
    std::string fourcc = "mp4v";
    std::string container_suffix = ".mp4";
    int smoothing_window = 5;
    int abort_check_frames = 30;
  };

  OpenCvChunkPipeline(Config cfg, DetectionTrackerFactory factory);

  sdk::ChunkRenderResult render(const sdk::ChunkRenderRequest& request) override;

 private:
  Config cfg_;
  DetectionTrackerFactory factory_;
};

}  // namespace vscrub::vision
