#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

namespace vscrub::sdk {

// Task payloads travel as MessagePack; records are stored as JSON text.
std::vector<std::uint8_t> encode_json(const nlohmann::json& value);
bool decode_json(const void* data, std::size_t len, nlohmann::json& out);

std::vector<std::uint8_t> dump_json_bytes(const nlohmann::json& value);
bool parse_json_bytes(const std::vector<std::uint8_t>& bytes, nlohmann::json& out);

}  // namespace vscrub::sdk
