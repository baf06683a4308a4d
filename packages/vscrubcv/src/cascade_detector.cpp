#include "vscrubcv/cascade_detector.h"

#include <cmath>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

#include "vscrubsdk/config.h"
#include "vscrubsdk/errors.h"

namespace vscrub::vision {

CascadeDetectionTracker::CascadeDetectionTracker(Config cfg)
    : cfg_(std::move(cfg)), tracker_(cfg_.iou_threshold, cfg_.max_missed) {
  if (cfg_.models.empty()) {
    throw sdk::ProcessingError(sdk::ErrorCode::kModelInference, "no detector model configured");
  }
  cascades_.reserve(cfg_.models.size());
  for (const auto& model : cfg_.models) {
    Loaded loaded;
    loaded.class_label = model.class_label;
    bool ok = false;
    try {
      ok = !model.path.empty() && loaded.cascade.load(model.path);
    } catch (const cv::Exception& ex) {
      throw sdk::ProcessingError(sdk::ErrorCode::kModelInference, std::string("cascade load failed: ") + ex.what());
    }
    if (!ok) {
      throw sdk::ProcessingError(sdk::ErrorCode::kModelInference,
                                 "cannot load " + model.class_label + " detector model " + model.path);
    }
    cascades_.push_back(std::move(loaded));
  }
}

std::vector<Detection> CascadeDetectionTracker::infer(const cv::Mat& frame_bgr) {
  std::vector<Detection> out;
  if (frame_bgr.empty()) return out;
  try {
    cv::Mat gray;
    cv::cvtColor(frame_bgr, gray, cv::COLOR_BGR2GRAY);
    cv::equalizeHist(gray, gray);

    for (auto& model : cascades_) {
      std::vector<cv::Rect> boxes;
      std::vector<int> levels;
      std::vector<double> weights;
      model.cascade.detectMultiScale(gray, boxes, levels, weights, cfg_.scale_factor, cfg_.min_neighbors, 0,
                                     cv::Size(cfg_.min_size_px, cfg_.min_size_px), cv::Size(), true);
      for (std::size_t i = 0; i < boxes.size(); ++i) {
        Detection d;
        d.bbox = boxes[i];
        d.class_label = model.class_label;
        const double w = i < weights.size() ? weights[i] : 0.0;
        d.confidence = static_cast<float>(1.0 / (1.0 + std::exp(-w)));
        d.embedding = appearance_embedding(frame_bgr, d.bbox);
        out.push_back(std::move(d));
      }
    }
  } catch (const cv::Exception& ex) {
    throw sdk::ProcessingError(sdk::ErrorCode::kModelInference, std::string("detector failed: ") + ex.what());
  }
  tracker_.assign(out);
  return out;
}

std::vector<CascadeModel> cascade_models(const std::string& face_model, const std::vector<std::string>& entries) {
  std::vector<CascadeModel> models;
  if (!face_model.empty()) {
    models.push_back(CascadeModel{"face", face_model});
  }
  for (const auto& entry : entries) {
    CascadeModel m;
    if (!sdk::split_detector_entry(entry, m.class_label, m.path)) {
      throw std::invalid_argument("detector entry must be label=model-path: " + entry);
    }
    models.push_back(std::move(m));
  }
  return models;
}

DetectionTrackerFactory make_cascade_factory(const CascadeDetectionTracker::Config& cfg) {
  return [cfg]() -> std::unique_ptr<DetectionTracker> { return std::make_unique<CascadeDetectionTracker>(cfg); };
}

}  // namespace vscrub::vision
