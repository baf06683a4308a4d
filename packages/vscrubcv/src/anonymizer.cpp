#include "vscrubcv/anonymizer.h"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace vscrub::vision {

void apply_redaction(cv::Mat& frame, const cv::Rect& region, RedactionMode mode) {
  const cv::Rect r = region & cv::Rect(0, 0, frame.cols, frame.rows);
  if (r.area() <= 0) return;
  cv::Mat roi = frame(r);
  switch (mode) {
    case RedactionMode::kBlur: {
      int k = std::max(3, std::min(99, std::min(r.width, r.height) | 1));
      cv::GaussianBlur(roi, roi, cv::Size(k, k), 30.0);
      break;
    }
    case RedactionMode::kPixelate: {
      cv::Mat small;
      cv::resize(roi, small, cv::Size(std::max(1, r.width / 10), std::max(1, r.height / 10)), 0, 0,
                 cv::INTER_LINEAR);
      cv::resize(small, roi, r.size(), 0, 0, cv::INTER_NEAREST);
      break;
    }
    case RedactionMode::kBlackBox:
      roi.setTo(cv::Scalar::all(0));
      break;
  }
}

std::vector<cv::Rect> BoxSmoother::step(std::int64_t frame_index, const std::vector<Observation>& observations) {
  std::vector<cv::Rect> out;
  for (const auto& obs : observations) {
    if (obs.track_id < 0) {
      out.push_back(obs.region);  // untracked: redact as observed
      continue;
    }
    History& h = tracks_[obs.track_id];
    h.boxes.push_back(obs.region);
    while (static_cast<int>(h.boxes.size()) > window_) h.boxes.pop_front();
    h.last_seen = frame_index;
  }

  for (auto it = tracks_.begin(); it != tracks_.end();) {
    History& h = it->second;
    if (frame_index - h.last_seen >= window_) {
      it = tracks_.erase(it);
      continue;
    }
    double x = 0, y = 0, w = 0, hh = 0;
    for (const auto& b : h.boxes) {
      x += b.x;
      y += b.y;
      w += b.width;
      hh += b.height;
    }
    const double n = static_cast<double>(h.boxes.size());
    cv::Rect mean(static_cast<int>(std::lround(x / n)), static_cast<int>(std::lround(y / n)),
                  static_cast<int>(std::lround(w / n)), static_cast<int>(std::lround(hh / n)));
    // Never shrink below the newest observation.
    out.push_back(mean | h.boxes.back());
    ++it;
  }
  return out;
}

int Anonymizer::process(cv::Mat& frame, std::int64_t frame_index, const std::vector<Detection>& detections) {
  std::vector<BoxSmoother::Observation> obs;
  obs.reserve(detections.size());
  for (const auto& d : detections) {
    const auto region = redaction_region(d.class_label, d.confidence, d.bbox, policy_, frame.size());
    if (!region.has_value()) continue;
    obs.push_back(BoxSmoother::Observation{d.local_track_id, *region});
  }
  const auto regions = smoother_.step(frame_index, obs);
  for (const auto& r : regions) {
    apply_redaction(frame, r, policy_.mode);
  }
  return static_cast<int>(regions.size());
}

}  // namespace vscrub::vision
