#pragma once

#include "vscrubcv/detection.h"
#include "vscrubsdk/chunk_pipeline.h"

namespace vscrub::vision {

// OpenCV still-image pipeline: decodes the image, runs one detection pass with a
// fresh tracker, redacts under the resolved policy and re-encodes.
class OpenCvImagePipeline final : public sdk::ImagePipeline {
 public:
  struct Config {
    int jpeg_quality = 92;
  };

  OpenCvImagePipeline(Config cfg, DetectionTrackerFactory factory);

  sdk::ImageRenderResult render(const sdk::ImageRenderRequest& request) override;

 private:
  Config cfg_;
  DetectionTrackerFactory factory_;
};

}  // namespace vscrub::vision
