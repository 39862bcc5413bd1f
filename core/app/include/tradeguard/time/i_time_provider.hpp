#pragma once

#include "tradeguard/time/time_utils.hpp"

#include <cstdint>

namespace tradeguard {

// -----------------------------------------------------------------------------
// ITimeProvider: injectable clock
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "what time is it" so rate windows and timestamps can be
//         driven deterministically in tests.
//
// @details
// - LiveTimeProvider:       system_clock.
// - SimulationTimeProvider: returns the last value written by advance_time().
//
// Thread-safety: implementations must be safe to call from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;

  // Convenience: now_ms() as a Timestamp.
  Timestamp now() const { return ms_to_timestamp(now_ms()); }
};

}  // namespace tradeguard
