#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>
#include <opencv2/core.hpp>

namespace vscrub::vision {

enum class RedactionMode : std::uint8_t {
  kBlur,
  kPixelate,
  kBlackBox,
};

const char* to_string(RedactionMode mode);
bool parse_redaction_mode(const std::string& text, RedactionMode& out);

enum class RedactionTarget : std::uint8_t {
  kNone,
  kFace,
  kPlate,
  kLogo,
  kText,
};

RedactionTarget target_for_class(const std::string& class_label);

struct RedactionPolicy {
  bool faces = true;
  bool plates = true;
  bool logos = false;
  bool text = false;
  RedactionMode mode = RedactionMode::kBlur;
  float min_confidence = 0.4f;
  bool heuristics = true;
};

// Builds the policy of a compliance profile (NONE, GDPR, CCPA, HIPAA_SAFE_HARBOR)
// and applies user overrides that never weaken it: extra targets may be enabled,
// the mode may change except under HIPAA_SAFE_HARBOR, and a confidence threshold
// may only be raised above the profile minimum.
bool resolve_policy(const std::string& profile, const nlohmann::json& options, RedactionPolicy& out, std::string& err);

// Region of the frame to anonymize for one detection, or nothing when the detection is
// below threshold or its target is disabled. Person detections cover the head (top
// 20%), vehicles the plate area (bottom 25%).
std::optional<cv::Rect> redaction_region(const std::string& class_label, float confidence, const cv::Rect& bbox,
                                           const RedactionPolicy& policy, const cv::Size& frame_size);

}  // namespace vscrub::vision
