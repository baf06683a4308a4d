#include "vscrubsdk/naming.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <random>
#include <stdexcept>

namespace vscrub::sdk {

namespace {

std::string trim(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) { return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
              value.end());
  return value;
}

}  // namespace

std::string ensure_token(std::string value, const char* label) {
  value = trim(std::move(value));
  if (value.empty()) {
    throw std::invalid_argument(std::string(label ? label : "token") + " must be non-empty");
  }
  if (value.find('.') != std::string::npos) {
    throw std::invalid_argument(std::string(label ? label : "token") + " must not contain '.'");
  }
  for (const unsigned char ch : value) {
    if (std::isspace(ch) || ch == '*' || ch == '>') {
      throw std::invalid_argument(std::string(label ? label : "token") + " contains an invalid character");
    }
  }
  return value;
}

std::string make_job_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  const std::uint64_t hi = rng();
  const std::uint64_t lo = rng();
  char buf[40] = {};
  std::snprintf(buf, sizeof(buf), "job-%016llx%016llx", static_cast<unsigned long long>(hi),
                static_cast<unsigned long long>(lo));
  return std::string(buf);
}

std::string kv_key_job(const std::string& job_id) { return "jobs." + ensure_token(job_id, "job_id"); }

std::string kv_key_chunk(const std::string& job_id, int index) {
  if (index < 0) {
    throw std::invalid_argument("chunk index must be non-negative");
  }
  return "chunks." + ensure_token(job_id, "job_id") + "." + std::to_string(index);
}

std::string kv_prefix_jobs() { return "jobs."; }

std::string kv_prefix_chunks(const std::string& job_id) { return "chunks." + ensure_token(job_id, "job_id") + "."; }

std::string job_id_from_key(const std::string& key) {
  const std::string prefix = kv_prefix_jobs();
  if (key.size() <= prefix.size() || key.compare(0, prefix.size(), prefix) != 0) {
    return {};
  }
  const std::string id = key.substr(prefix.size());
  if (id.find('.') != std::string::npos) {
    return {};
  }
  return id;
}

std::string task_subject(const std::string& stream_prefix, const std::string& kind) {
  return ensure_token(stream_prefix, "stream_prefix") + ".tasks." + ensure_token(kind, "kind");
}

std::string task_subject_wildcard(const std::string& stream_prefix) {
  return ensure_token(stream_prefix, "stream_prefix") + ".tasks.>";
}

std::string api_endpoint_subject(const std::string& api_prefix, const std::string& endpoint) {
  return ensure_token(api_prefix, "api_prefix") + ".api." + ensure_token(endpoint, "endpoint");
}

}  // namespace vscrub::sdk
