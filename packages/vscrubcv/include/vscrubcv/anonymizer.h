#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <vector>

#include <opencv2/core.hpp>

#include "vscrubcv/detection.h"
#include "vscrubcv/redaction_policy.h"

namespace vscrub::vision {

// Blur, pixelate or fill `region` in place.
void apply_redaction(cv::Mat& frame, const cv::Rect& region, RedactionMode mode);

// Temporal smoothing of redaction regions per track over a sliding window of
// frames. A track that drops out keeps its last smoothed region until it has been
// missing for a full window, so short detector misses do not flash the subject.
class BoxSmoother {
 public:
  explicit BoxSmoother(int window) : window_(window > 0 ? window : 1) {}

  struct Observation {
    std::int64_t track_id = -1;
    cv::Rect region;
  };

  // Regions to redact in frame `frame_index` given this frame's observations.
  std::vector<cv::Rect> step(std::int64_t frame_index, const std::vector<Observation>& observations);

 private:
  struct History {
    std::deque<cv::Rect> boxes;
    std::int64_t last_seen = 0;
  };

  int window_;
  std::map<std::int64_t, History> tracks_;
};

// Policy + smoothing + redaction for one chunk.
class Anonymizer {
 public:
  Anonymizer(RedactionPolicy policy, int smoothing_window) : policy_(policy), smoother_(smoothing_window) {}

  // Returns the number of regions redacted.
  int process(cv::Mat& frame, std::int64_t frame_index, const std::vector<Detection>& detections);

  const RedactionPolicy& policy() const { return policy_; }

 private:
  RedactionPolicy policy_;
  BoxSmoother smoother_;
};

}  // namespace vscrub::vision
