#include "vscrubcv/detection.h"

#include <algorithm>
#include <tuple>

#include <opencv2/imgproc.hpp>

namespace vscrub::vision {

std::vector<float> appearance_embedding(const cv::Mat& frame_bgr, const cv::Rect& box) {
  constexpr int kHueBins = 16;
  constexpr int kSatBins = 4;
  std::vector<float> out(kHueBins * kSatBins, 0.0f);
  const cv::Rect roi = box & cv::Rect(0, 0, frame_bgr.cols, frame_bgr.rows);
  if (roi.area() <= 0) return out;

  cv::Mat hsv;
  cv::cvtColor(frame_bgr(roi), hsv, cv::COLOR_BGR2HSV);
  const int channels[] = {0, 1};
  const int bins[] = {kHueBins, kSatBins};
  const float hue_range[] = {0.0f, 180.0f};
  const float sat_range[] = {0.0f, 256.0f};
  const float* ranges[] = {hue_range, sat_range};
  cv::Mat hist;
  cv::calcHist(&hsv, 1, channels, cv::Mat(), hist, 2, bins, ranges, true, false);
  cv::normalize(hist, hist, 1.0, 0.0, cv::NORM_L2);
  for (int h = 0; h < kHueBins; ++h) {
    for (int s = 0; s < kSatBins; ++s) {
      out[static_cast<std::size_t>(h * kSatBins + s)] = hist.at<float>(h, s);
    }
  }
  return out;
}

float box_iou(const cv::Rect& a, const cv::Rect& b) {
  const int inter = (a & b).area();
  const int uni = a.area() + b.area() - inter;
  return uni > 0 ? static_cast<float>(inter) / static_cast<float>(uni) : 0.0f;
}

void IouTracker::assign(std::vector<Detection>& detections) {
  std::vector<std::tuple<float, std::size_t, std::size_t>> pairs;
  for (std::size_t t = 0; t < tracks_.size(); ++t) {
    for (std::size_t d = 0; d < detections.size(); ++d) {
      if (tracks_[t].class_label != detections[d].class_label) continue;
      const float iou = box_iou(tracks_[t].bbox, detections[d].bbox);
      if (iou >= iou_threshold_) pairs.emplace_back(iou, t, d);
    }
  }
  std::sort(pairs.begin(), pairs.end(), [](const auto& x, const auto& y) { return std::get<0>(x) > std::get<0>(y); });

  std::vector<bool> track_used(tracks_.size(), false);
  std::vector<bool> det_used(detections.size(), false);
  for (const auto& [iou, t, d] : pairs) {
    if (track_used[t] || det_used[d]) continue;
    track_used[t] = true;
    det_used[d] = true;
    tracks_[t].bbox = detections[d].bbox;
    tracks_[t].missed = 0;
    detections[d].local_track_id = tracks_[t].id;
  }

  for (std::size_t t = 0; t < tracks_.size(); ++t) {
    if (!track_used[t]) ++tracks_[t].missed;
  }
  tracks_.erase(std::remove_if(tracks_.begin(), tracks_.end(), [&](const Track& tr) { return tr.missed > max_missed_; }),
                tracks_.end());

  for (std::size_t d = 0; d < detections.size(); ++d) {
    if (det_used[d]) continue;
    Track tr;
    tr.id = next_id_++;
    tr.bbox = detections[d].bbox;
    tr.class_label = detections[d].class_label;
    detections[d].local_track_id = tr.id;
    tracks_.push_back(std::move(tr));
  }
}

}  // namespace vscrub::vision
