#include "tradeguard/time/live_time_provider.hpp"

#include <chrono>

namespace tradeguard {

std::int64_t LiveTimeProvider::now_ms() const {
  return timestamp_to_ms(std::chrono::system_clock::now());
}

}  // namespace tradeguard
