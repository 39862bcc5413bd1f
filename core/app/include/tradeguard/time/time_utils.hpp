#pragma once

#include <chrono>
#include <cstdint>

namespace tradeguard {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time used for order timestamps, event log entries and risk
// events. system_clock so values convert to epoch milliseconds for JSON.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace tradeguard
