#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace vscrub::vision {

struct Detection {
  cv::Rect bbox;
  std::string class_label;
  float confidence = 0.0f;
  std::int64_t local_track_id = -1;  // stable within one chunk
  std::vector<float> embedding;
};

// Detection and tracking capability. One instance tracks one chunk; track ids are
// only meaningful inside it. Throws ProcessingError(kModelInference) on failure.
class DetectionTracker {
 public:
  virtual ~DetectionTracker() = default;
  virtual std::vector<Detection> infer(const cv::Mat& frame_bgr) = 0;
};

using DetectionTrackerFactory = std::function<std::unique_ptr<DetectionTracker>()>;

// L2-normalized hue/saturation histogram of the box, 64 values.
std::vector<float> appearance_embedding(const cv::Mat& frame_bgr, const cv::Rect& box);

float box_iou(const cv::Rect& a, const cv::Rect& b);

// Greedy IoU association of detections to live tracks; assigns local_track_id.
class IouTracker {
 public:
  IouTracker(float iou_threshold, int max_missed) : iou_threshold_(iou_threshold), max_missed_(max_missed) {}

  void assign(std::vector<Detection>& detections);

 private:
  struct Track {
    std::int64_t id = 0;
    cv::Rect bbox;
    std::string class_label;
    int missed = 0;
  };

  float iou_threshold_;
  int max_missed_;
  std::int64_t next_id_ = 1;
  std::vector<Track> tracks_;
};

}  // namespace vscrub::vision
