#pragma once

#include "tradeguard/domain/decimal.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace tradeguard {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception hierarchy shared by the order entity, the order service
//         and the risk layer.
//
// @details
//   Error                         common base, catch-all for engine errors
//   ├── ValidationError           malformed input (bad field, bad enum)
//   ├── InvalidStateTransitionError
//   │                             order method called from a state that does
//   │                             not permit it; the order is left unchanged
//   ├── DependencyUnavailableError
//   │                             a collaborator (limits store, exposure
//   │                             calculator, order-rate lookup) failed;
//   │                             caught inside the risk checker and never
//   │                             surfaced to callers of validateOrder()
//   └── RiskViolationError        a computed value exceeds a configured limit
//       └── OrderBlockedError     raised by OrderService when a freshly built
//                                 order is blocked by risk management
//
// Callers branch on the concrete type: a RiskViolationError means "blocked",
// a ValidationError means "malformed".
//
// Thread model:
//   Value types. Safe to throw across the synchronous call path; never
//   thrown into the background loops.
// -----------------------------------------------------------------------------
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ValidationError : public Error {
 public:
  ValidationError(std::string field, const std::string& message)
      : Error(message), field_(std::move(field)) {}

  // Name of the offending field ("quantity", "expires_at", ...), may be empty.
  const std::string& field() const { return field_; }

 private:
  std::string field_;
};

class InvalidStateTransitionError : public Error {
 public:
  InvalidStateTransitionError(std::string from_state, std::string operation)
      : Error("invalid state transition: cannot " + operation +
              " order in state " + from_state),
        from_state_(std::move(from_state)),
        operation_(std::move(operation)) {}

  InvalidStateTransitionError(std::string from_state, std::string operation,
                              const std::string& detail)
      : Error("invalid state transition: cannot " + operation +
              " order in state " + from_state + ": " + detail),
        from_state_(std::move(from_state)),
        operation_(std::move(operation)) {}

  const std::string& fromState() const { return from_state_; }
  const std::string& operation() const { return operation_; }

 private:
  std::string from_state_;
  std::string operation_;
};

class DependencyUnavailableError : public Error {
 public:
  DependencyUnavailableError(std::string dependency, const std::string& message)
      : Error(dependency + " unavailable: " + message),
        dependency_(std::move(dependency)) {}

  const std::string& dependency() const { return dependency_; }

 private:
  std::string dependency_;
};

// Which rule produced a RiskViolationError.
enum class RiskViolationKind {
  OrderSize,
  PositionSize,
  Exposure,
  OrderRate,
  MarketClosed,
  DailyLoss,
  Margin,
  Drawdown,
};

const char* toString(RiskViolationKind kind);

class RiskViolationError : public Error {
 public:
  RiskViolationError(RiskViolationKind kind, std::string strategy_id,
                     std::string symbol, domain::Decimal current_value,
                     domain::Decimal limit_value, const std::string& message)
      : Error(message),
        kind_(kind),
        strategy_id_(std::move(strategy_id)),
        symbol_(std::move(symbol)),
        current_value_(current_value),
        limit_value_(limit_value) {}

  RiskViolationKind kind() const { return kind_; }
  const std::string& strategyId() const { return strategy_id_; }
  const std::string& symbol() const { return symbol_; }
  domain::Decimal currentValue() const { return current_value_; }
  domain::Decimal limitValue() const { return limit_value_; }

 protected:
  RiskViolationError(const RiskViolationError& cause, const std::string& message)
      : Error(message),
        kind_(cause.kind_),
        strategy_id_(cause.strategy_id_),
        symbol_(cause.symbol_),
        current_value_(cause.current_value_),
        limit_value_(cause.limit_value_) {}

 private:
  RiskViolationKind kind_;
  std::string strategy_id_;
  std::string symbol_;
  domain::Decimal current_value_;
  domain::Decimal limit_value_;
};

class OrderBlockedError : public RiskViolationError {
 public:
  explicit OrderBlockedError(const RiskViolationError& cause)
      : RiskViolationError(
            cause,
            std::string("order blocked by risk management: ") + cause.what()) {}
};

}  // namespace tradeguard
