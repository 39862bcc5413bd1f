#pragma once

#include "tradeguard/domain/order.hpp"

namespace tradeguard {

// -----------------------------------------------------------------------------
// IOrderValidator: pre-trade validation seam
// -----------------------------------------------------------------------------
//
// @brief  Abstract interface used by OrderService to run the pre-trade risk
//         rules against a freshly built Order.
//
// @details
// Two implementations exist:
//   - RiskChecker: pure rule evaluation, no counters, no events.
//   - RiskService: same rules, plus counters, RiskEvent emission and the
//                  asynchronous event pipeline.
//
// validateOrder() returns normally when the order passes and throws
// RiskViolationError on the first failing rule.
// -----------------------------------------------------------------------------
class IOrderValidator {
 public:
  virtual ~IOrderValidator() = default;

  // @throws RiskViolationError on the first failing rule.
  virtual void validateOrder(const domain::Order& order) = 0;
};

}  // namespace tradeguard
