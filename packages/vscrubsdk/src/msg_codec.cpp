#include "vscrubsdk/msg_codec.h"

#include <exception>
#include <string>

namespace vscrub::sdk {

std::vector<std::uint8_t> encode_json(const nlohmann::json& value) {
  return nlohmann::json::to_msgpack(value);
}

bool decode_json(const void* data, std::size_t len, nlohmann::json& out) {
  if (data == nullptr || len == 0) {
    return false;
  }
  try {
    const auto* begin = static_cast<const std::uint8_t*>(data);
    const auto* end = begin + len;
    out = nlohmann::json::from_msgpack(begin, end);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

std::vector<std::uint8_t> dump_json_bytes(const nlohmann::json& value) {
  const std::string raw = value.dump();
  return std::vector<std::uint8_t>(raw.begin(), raw.end());
}

bool parse_json_bytes(const std::vector<std::uint8_t>& bytes, nlohmann::json& out) {
  if (bytes.empty()) {
    return false;
  }
  out = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
  return !out.is_discarded();
}

}  // namespace vscrub::sdk
