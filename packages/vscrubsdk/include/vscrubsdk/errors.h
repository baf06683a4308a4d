#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace vscrub::sdk {

enum class ErrorCode : std::uint8_t {
  kStaleTransition,
  kTransientIo,
  kModelInference,
  kCorruptInput,
  kCancelled,
  kNotFound,
  kInvalidArgument,
  kInternal,
};

const char* to_string(ErrorCode code);
bool parse_error_code(const std::string& text, ErrorCode& out);

// Whether a failure of this kind may succeed when tried again.
bool is_retryable(ErrorCode code);

// Details of a failed operation, filled through out-parameters.
struct OpError {
  ErrorCode code = ErrorCode::kInternal;
  std::string message;
};

inline void set_error(OpError* err, ErrorCode code, std::string message) {
  if (err == nullptr) return;
  err->code = code;
  err->message = std::move(message);
}

// Thrown inside the chunk and stitch pipelines; caught at the task handler boundary.
class ProcessingError : public std::runtime_error {
 public:
  ProcessingError(ErrorCode code, const std::string& message) : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

}  // namespace vscrub::sdk
