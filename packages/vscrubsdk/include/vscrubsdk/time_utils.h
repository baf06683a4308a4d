#pragma once

#include <cstdint>

namespace vscrub::sdk {

// Wall clock in milliseconds since the Unix epoch.
std::int64_t now_ms();

// Sleep helper used by retry loops.
void sleep_ms(std::int64_t ms);

// Exponential backoff: base * 2^(attempt-1), capped at max. `attempt` starts at 1.
std::int64_t backoff_ms(int attempt, std::int64_t base_ms, std::int64_t max_ms);

}  // namespace vscrub::sdk
