#pragma once

#include <string>
#include <vector>

#include <opencv2/objdetect.hpp>

#include "vscrubcv/detection.h"

namespace vscrub::vision {

struct CascadeModel {
  std::string class_label;
  std::string path;
};

// Haar/LBP cascade detectors, one class label per model, sharing one IoU tracker
// and histogram embeddings.
class CascadeDetectionTracker final : public DetectionTracker {
 public:
  struct Config {
    std::vector<CascadeModel> models;
    double scale_factor = 1.1;
    int min_neighbors = 4;
    int min_size_px = 24;
    float iou_threshold = 0.3f;
    int max_missed = 15;
  };

  explicit CascadeDetectionTracker(Config cfg);

  std::vector<Detection> infer(const cv::Mat& frame_bgr) override;

 private:
  struct Loaded {
    std::string class_label;
    cv::CascadeClassifier cascade;
  };

  Config cfg_;
  std::vector<Loaded> cascades_;
  IouTracker tracker_;
};

// The face model (when set) followed by "label=path" entries. Throws
// std::invalid_argument on a malformed entry.
std::vector<CascadeModel> cascade_models(const std::string& face_model, const std::vector<std::string>& entries);

// Factory that loads the cascades once per chunk attempt.
DetectionTrackerFactory make_cascade_factory(const CascadeDetectionTracker::Config& cfg);

}  // namespace vscrub::vision
