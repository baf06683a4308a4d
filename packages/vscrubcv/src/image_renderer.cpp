#include "vscrubcv/image_renderer.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

#include "vscrubcv/anonymizer.h"
#include "vscrubcv/redaction_policy.h"
#include "vscrubsdk/errors.h"

namespace vscrub::vision {

using sdk::ErrorCode;
using sdk::ProcessingError;

OpenCvImagePipeline::OpenCvImagePipeline(Config cfg, DetectionTrackerFactory factory)
    : cfg_(cfg), factory_(std::move(factory)) {
  if (!factory_) {
    throw std::invalid_argument("OpenCvImagePipeline requires a detection tracker factory");
  }
}

sdk::ImageRenderResult OpenCvImagePipeline::render(const sdk::ImageRenderRequest& req) {
  RedactionPolicy policy;
  std::string policy_err;
  if (!resolve_policy(req.profile, req.options, policy, policy_err)) {
    throw ProcessingError(ErrorCode::kInvalidArgument, policy_err);
  }
  if (req.input_bytes.empty()) {
    throw ProcessingError(ErrorCode::kCorruptInput, "empty image");
  }

  cv::Mat image;
  try {
    image = cv::imdecode(req.input_bytes, cv::IMREAD_COLOR);
  } catch (const cv::Exception& ex) {
    throw ProcessingError(ErrorCode::kCorruptInput, std::string("image decode failed: ") + ex.what());
  }
  if (image.empty()) {
    throw ProcessingError(ErrorCode::kCorruptInput, "input is not a decodable image");
  }

  std::unique_ptr<DetectionTracker> tracker = factory_();
  std::vector<Detection> detections;
  try {
    detections = tracker->infer(image);
  } catch (const cv::Exception& ex) {
    throw ProcessingError(ErrorCode::kModelInference, std::string("inference failed: ") + ex.what());
  }

  // A single frame: no smoothing history to carry.
  Anonymizer anonymizer(policy, 1);
  sdk::ImageRenderResult result;
  result.regions = anonymizer.process(image, 0, detections);

  std::vector<int> params;
  if (req.format == ".jpg") params = {cv::IMWRITE_JPEG_QUALITY, cfg_.jpeg_quality};
  try {
    if (!cv::imencode(req.format, image, result.output_bytes, params)) {
      throw ProcessingError(ErrorCode::kInvalidArgument, "cannot encode image as " + req.format);
    }
  } catch (const cv::Exception& ex) {
    throw ProcessingError(ErrorCode::kInvalidArgument, std::string("image encode failed: ") + ex.what());
  }
  spdlog::debug("image rendered detections={} regions={} format={} mode={}", detections.size(), result.regions,
                req.format, to_string(policy.mode));
  return result;
}

}  // namespace vscrub::vision
