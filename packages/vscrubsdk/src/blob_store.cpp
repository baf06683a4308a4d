#include "vscrubsdk/blob_store.h"

namespace vscrub::sdk {

std::string blob_ref_scope(const std::string& ref) {
  static const std::string scheme = "blob:";
  if (ref.compare(0, scheme.size(), scheme) != 0) {
    return std::string();
  }
  const auto slash = ref.find('/', scheme.size());
  if (slash == std::string::npos) {
    return std::string();
  }
  return ref.substr(scheme.size(), slash - scheme.size());
}

bool valid_blob_scope(const std::string& scope) {
  if (scope.empty() || scope.size() > 128 || scope[0] == '.') {
    return false;
  }
  for (const char c : scope) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
                    c == '-' || c == '.';
    if (!ok) return false;
  }
  return true;
}

}  // namespace vscrub::sdk
