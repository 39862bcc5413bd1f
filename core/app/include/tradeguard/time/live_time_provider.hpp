#pragma once

#include "tradeguard/time/i_time_provider.hpp"

namespace tradeguard {

// -----------------------------------------------------------------------------
// LiveTimeProvider
// -----------------------------------------------------------------------------
// @brief  Wall-clock time from std::chrono::system_clock, in milliseconds.
//
// Thread-safety: Safe to call from any thread. No shared mutable state.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradeguard
