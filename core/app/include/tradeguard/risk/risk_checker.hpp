#pragma once

#include "tradeguard/domain/order.hpp"
#include "tradeguard/domain/position.hpp"
#include "tradeguard/domain/risk_limits.hpp"
#include "tradeguard/risk/i_order_validator.hpp"
#include "tradeguard/risk/risk_data_sources.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace tradeguard {

// A computed risk value next to the limit it was compared with.
struct RiskReading {
  domain::Decimal value;
  domain::Decimal limit;
};

// -----------------------------------------------------------------------------
// RiskChecker
// -----------------------------------------------------------------------------
//
// @brief  Stateless, synchronous evaluation of the pre-trade and
//         surveillance risk rules.
//
// @details
// validateOrder() runs the order rules in a fixed order and throws on the
// first failure:
//
//   1. Order size     quantity <= max_order_size
//   2. Position       |net + sign(side) * quantity| <= max_position_size;
//                     passes when the strategy holds nothing in the symbol
//   3. Exposure       current_exposure + quantity * referencePrice()
//                     <= max_exposure; Market orders add 0
//   4. Order rate     orders in the last second < max_orders_per_second
//   5. Market hours   calendar says open (rule skipped without a calendar)
//
// Limits are fetched per call through limitsFor(). A strategy without
// stored limits, or a store that throws DependencyUnavailableError, gets
// the default set passed to the constructor.
//
// Degraded collaborators never block an order: when the exposure
// calculator, position lookup or order-rate source throws
// DependencyUnavailableError the rule logs a warning and passes. A limit
// that is actually exceeded always throws. A projected position or
// exposure too large for Decimal counts as Decimal::max() and fails its
// rule instead of leaking std::overflow_error.
//
// Thread model:
//   No mutable state. Safe to call concurrently from any thread provided
//   the collaborators are thread-safe.
//
// Ownership:
//   Holds non-owning pointers to the collaborators (see RiskDataSources)
//   and to the optional clock. All must outlive the checker.
// -----------------------------------------------------------------------------
class RiskChecker final : public IOrderValidator {
 public:
  static constexpr std::chrono::milliseconds kOrderRateWindow{1000};

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  sources         Collaborator bundle; null members disable the
  //                         rule they feed.
  // @param  default_limits  Fallback limits, validated here.
  // @param  clock           Time source for the market-hours rule. Null
  //                         means system_clock.
  //
  // @throws ValidationError if default_limits contains a negative value.
  // -------------------------------------------------------------------------
  RiskChecker(RiskDataSources sources, domain::RiskLimits default_limits,
              const ITimeProvider* clock = nullptr);

  // @throws RiskViolationError on the first failing order rule.
  void validateOrder(const domain::Order& order) override;

  // -------------------------------------------------------------------------
  // validatePosition(position)
  // -------------------------------------------------------------------------
  // @brief  Post-trade position rules, in order: size vs max_position_size,
  //         open loss (-unrealized_pnl) vs max_daily_loss, margin vs
  //         maintenance_margin.
  //
  // @throws RiskViolationError (PositionSize, DailyLoss or Margin).
  // -------------------------------------------------------------------------
  void validatePosition(const domain::Position& position) const;

  // -------------------------------------------------------------------------
  // checkExposure(strategy_id) / checkDrawdown(strategy_id)
  // -------------------------------------------------------------------------
  // @return The current reading when within limits, std::nullopt when the
  //         calculator is not configured or unavailable (warning logged).
  //
  // @throws RiskViolationError (Exposure / Drawdown) when the value exceeds
  //         max_exposure / max_drawdown_percent.
  // -------------------------------------------------------------------------
  std::optional<RiskReading> checkExposure(const std::string& strategy_id) const;
  std::optional<RiskReading> checkDrawdown(const std::string& strategy_id) const;

  // Stored limits for strategy_id, or the defaults.
  domain::RiskLimits limitsFor(const std::string& strategy_id) const;

  const domain::RiskLimits& defaultLimits() const { return default_limits_; }

  // Current time from the injected clock, or system_clock without one.
  Timestamp now() const;

 private:
  void checkOrderSize(const domain::Order& order,
                      const domain::RiskLimits& limits) const;
  void checkPositionLimit(const domain::Order& order,
                          const domain::RiskLimits& limits) const;
  void checkExposureLimit(const domain::Order& order,
                          const domain::RiskLimits& limits) const;
  void checkOrderRate(const domain::Order& order,
                      const domain::RiskLimits& limits) const;
  void checkMarketHours(const domain::Order& order) const;

  RiskDataSources sources_;
  domain::RiskLimits default_limits_;
  const ITimeProvider* clock_;
};

}  // namespace tradeguard
