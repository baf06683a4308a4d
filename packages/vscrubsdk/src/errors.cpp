#include "vscrubsdk/errors.h"

namespace vscrub::sdk {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::kStaleTransition:
      return "STALE_TRANSITION";
    case ErrorCode::kTransientIo:
      return "TRANSIENT_IO";
    case ErrorCode::kModelInference:
      return "MODEL_INFERENCE_ERROR";
    case ErrorCode::kCorruptInput:
      return "CORRUPT_INPUT";
    case ErrorCode::kCancelled:
      return "CANCELLED";
    case ErrorCode::kNotFound:
      return "NOT_FOUND";
    case ErrorCode::kInvalidArgument:
      return "INVALID_ARGUMENT";
    case ErrorCode::kInternal:
      return "INTERNAL";
  }
  return "INTERNAL";
}

bool parse_error_code(const std::string& text, ErrorCode& out) {
  static constexpr ErrorCode kAll[] = {ErrorCode::kStaleTransition, ErrorCode::kTransientIo,  ErrorCode::kModelInference,
                                       ErrorCode::kCorruptInput,    ErrorCode::kCancelled,    ErrorCode::kNotFound,
                                       ErrorCode::kInvalidArgument, ErrorCode::kInternal};
  for (const ErrorCode code : kAll) {
    if (text == to_string(code)) {
      out = code;
      return true;
    }
  }
  return false;
}

bool is_retryable(ErrorCode code) {
  return code == ErrorCode::kTransientIo || code == ErrorCode::kModelInference;
}

}  // namespace vscrub::sdk
