#pragma once

#include <functional>
#include <string>

#include "vscrubsdk/stitch_coordinator.h"

namespace vscrub::vision {

// Re-encodes the chunk files in order into one container. Frames are re-muxed by
// OpenCV, so no container metadata of the source survives.
class OpenCvConcatenator final : public sdk::VideoConcatenator {
 public:
  struct Config {
    std::string fourcc = "mp4v";
    std::string container_suffix = ".mp4";
    // Frames written between keepalive calls.
    int keepalive_frames = 250;
  };

  explicit OpenCvConcatenator(Config cfg) : cfg_(std::move(cfg)) {}

  std::vector<std::uint8_t> concatenate(const std::vector<std::string>& chunk_paths,
                                        const std::function<void()>& keepalive) override;

 private:
  Config cfg_;
};

}  // namespace vscrub::vision
