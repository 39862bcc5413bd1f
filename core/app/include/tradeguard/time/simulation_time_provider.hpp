#pragma once

#include "tradeguard/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradeguard {

// -----------------------------------------------------------------------------
// SimulationTimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Manually driven clock for tests and replays.
//
// @details
// Starts at the value given to the constructor (0 by default) and only moves
// when advance_time() or advance_by() is called. The order-rate tracker uses
// it in tests to step across one-second windows without sleeping.
//
// Monotonicity is the caller's responsibility; it is not enforced.
//
// Thread-safety: Safe to call from any thread. Lock-free on 64-bit
//                platforms.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to new_time_ms.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradeguard
