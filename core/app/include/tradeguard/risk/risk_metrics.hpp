#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>

namespace tradeguard {

// -----------------------------------------------------------------------------
// RiskMetrics: point-in-time counters from RiskService::getMetrics()
// -----------------------------------------------------------------------------
//
// @details
//   total_checks        every validateOrder / validatePosition /
//                       checkExposure / checkDrawdown call
//   violations          calls that threw RiskViolationError
//   blocked_orders      violations raised by validateOrder
//   violation_rate      violations / total_checks, 0 before the first check
//   risk_score          decayed severity score in [0, 100]
//   active_events       events in the map with resolved == false
//   dropped_events      events that did not fit in the event channel
//   dropped_violations  escalations that did not fit in the violation
//                       channel
//   evicted_events      events removed from the map to stay within
//                       max_stored_events
// -----------------------------------------------------------------------------
struct RiskMetrics {
  std::int64_t total_checks{0};
  std::int64_t violations{0};
  std::int64_t blocked_orders{0};
  double violation_rate{0.0};
  double risk_score{0.0};
  std::int64_t active_events{0};
  std::int64_t dropped_events{0};
  std::int64_t dropped_violations{0};
  std::int64_t evicted_events{0};

  nlohmann::json toJson() const {
    return nlohmann::json{{"total_checks", total_checks},
                          {"violations", violations},
                          {"blocked_orders", blocked_orders},
                          {"violation_rate", violation_rate},
                          {"risk_score", risk_score},
                          {"active_events", active_events},
                          {"dropped_events", dropped_events},
                          {"dropped_violations", dropped_violations},
                          {"evicted_events", evicted_events}};
  }
};

}  // namespace tradeguard
