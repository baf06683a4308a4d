#include "vscrubcv/redaction_policy.h"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace vscrub::vision {

using json = nlohmann::json;

const char* to_string(RedactionMode mode) {
  switch (mode) {
    case RedactionMode::kBlur:
      return "blur";
    case RedactionMode::kPixelate:
      return "pixelate";
    case RedactionMode::kBlackBox:
      return "black_box";
  }
  return "blur";
}

bool parse_redaction_mode(const std::string& text, RedactionMode& out) {
  if (text == "blur") {
    out = RedactionMode::kBlur;
  } else if (text == "pixelate") {
    out = RedactionMode::kPixelate;
  } else if (text == "black_box") {
    out = RedactionMode::kBlackBox;
  } else {
    return false;
  }
  return true;
}

RedactionTarget target_for_class(const std::string& label) {
  if (label == "face" || label == "person") return RedactionTarget::kFace;
  if (label == "license_plate" || label == "plate" || label == "car" || label == "motorcycle" || label == "bus" ||
      label == "truck") {
    return RedactionTarget::kPlate;
  }
  if (label == "logo" || label == "backpack" || label == "handbag" || label == "suitcase") {
    return RedactionTarget::kLogo;
  }
  if (label == "text") return RedactionTarget::kText;
  return RedactionTarget::kNone;
}

bool resolve_policy(const std::string& profile, const json& options, RedactionPolicy& out, std::string& err) {
  RedactionPolicy p;
  float floor = 0.0f;
  if (profile == "GDPR") {
    p.text = true;
    floor = 0.6f;
  } else if (profile == "HIPAA_SAFE_HARBOR") {
    p.text = true;
    p.logos = true;
    p.mode = RedactionMode::kBlackBox;
    floor = 0.7f;
  } else if (profile == "CCPA") {
    floor = 0.55f;
  } else if (profile != "NONE" && !profile.empty()) {
    err = "unknown compliance profile " + profile;
    return false;
  }
  if (floor > 0.0f) p.min_confidence = floor;

  if (options.is_object()) {
    if (options.value("targetLogos", false)) p.logos = true;
    if (options.value("targetText", false)) p.text = true;
    if (options.contains("confidenceThreshold") && options["confidenceThreshold"].is_number()) {
      const float requested = options["confidenceThreshold"].get<float>();
      p.min_confidence = floor > 0.0f ? std::max(floor, requested) : requested;
    }
    if (profile != "HIPAA_SAFE_HARBOR" && options.contains("mode") && options["mode"].is_string()) {
      RedactionMode mode;
      if (parse_redaction_mode(options["mode"].get<std::string>(), mode)) {
        p.mode = mode;
      }
    }
  }
  out = p;
  return true;
}

std::optional<cv::Rect> redaction_region(const std::string& class_label, float confidence, const cv::Rect& bbox,
                                           const RedactionPolicy& policy, const cv::Size& frame_size) {
  if (confidence < policy.min_confidence) return std::nullopt;

  cv::Rect region = bbox;
  switch (target_for_class(class_label)) {
    case RedactionTarget::kNone:
      return std::nullopt;
    case RedactionTarget::kFace:
      if (!policy.faces) return std::nullopt;
      if (class_label == "person") {
        region.height = std::max(1, static_cast<int>(bbox.height * 0.20));
      }
      break;
    case RedactionTarget::kPlate:
      if (!policy.plates) return std::nullopt;
      if (class_label != "license_plate" && class_label != "plate") {
        if (!policy.heuristics) return std::nullopt;
        const int bumper = std::max(1, static_cast<int>(bbox.height * 0.25));
        region.y = bbox.y + bbox.height - bumper;
        region.height = bumper;
      }
      break;
    case RedactionTarget::kLogo:
      if (!policy.logos) return std::nullopt;
      break;
    case RedactionTarget::kText:
      if (!policy.text) return std::nullopt;
      break;
  }
  region &= cv::Rect(0, 0, frame_size.width, frame_size.height);
  if (region.area() <= 0) return std::nullopt;
  return region;
}

}  // namespace vscrub::vision
