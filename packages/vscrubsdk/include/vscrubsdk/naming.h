#pragma once

#include <string>

namespace vscrub::sdk {

// Ensure a string is safe to use as a single NATS subject / KV key token (no dots).
std::string ensure_token(std::string value, const char* label);

// Random job identifier, a valid token.
std::string make_job_id();

// Record store keys.
std::string kv_key_job(const std::string& job_id);
std::string kv_key_chunk(const std::string& job_id, int index);
std::string kv_prefix_jobs();
std::string kv_prefix_chunks(const std::string& job_id);

// Returns the job id for a `jobs.<id>` key, or an empty string.
std::string job_id_from_key(const std::string& key);

// Task queue subjects.
std::string task_subject(const std::string& stream_prefix, const std::string& kind);
std::string task_subject_wildcard(const std::string& stream_prefix);

// Request/reply endpoint subject of the job API.
std::string api_endpoint_subject(const std::string& api_prefix, const std::string& endpoint);

}  // namespace vscrub::sdk
