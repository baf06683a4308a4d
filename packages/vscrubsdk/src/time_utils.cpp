#include "vscrubsdk/time_utils.h"

#include <algorithm>
#include <chrono>
#include <thread>

namespace vscrub::sdk {

std::int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void sleep_ms(std::int64_t ms) {
  if (ms <= 0) return;
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::int64_t backoff_ms(int attempt, std::int64_t base_ms, std::int64_t max_ms) {
  if (attempt < 1) attempt = 1;
  if (base_ms <= 0) return 0;
  std::int64_t delay = base_ms;
  for (int i = 1; i < attempt && delay < max_ms; ++i) {
    delay *= 2;
  }
  return max_ms > 0 ? std::min(delay, max_ms) : delay;
}

}  // namespace vscrub::sdk
