#pragma once

#include "tradeguard/domain/decimal.hpp"

#include <cstdint>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: per-strategy hard risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of risk parameters that govern pre-trade
//         order checks and the background exposure / drawdown monitors.
//
// @details
// A RiskLimits value is looked up per strategy through IRiskLimitsStore.
// When a strategy has no entry (or the store is unreachable) the checker
// falls back to the default set it was constructed with. That default set
// is built explicitly by the composition root, normally from
// defaultRiskLimits() overlaid with the "default_limits" section of the
// engine configuration.
//
// Units:
//   max_position_size, max_order_size    instrument units
//   max_daily_loss, max_exposure         quote currency
//   max_drawdown_percent                 percent of peak equity (20 = 20%)
//   max_orders_per_second                count per one-second window
//   stop_loss_percent, take_profit_percent
//                                        percent, carried for strategies
//                                        and reported in snapshots
//
// Thread model:
//   Plain data struct with value semantics. Copied into components at
//   construction time; no shared mutable state.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Maximum absolute net position per symbol. A new order that would push
  /// abs(net_quantity + signed_qty) above this value is rejected.
  Decimal max_position_size;

  /// Maximum quantity of a single order.
  Decimal max_order_size;

  /// Largest tolerated open loss on a position (positive number).
  Decimal max_daily_loss;

  /// Drawdown percentage that stops the strategy.
  Decimal max_drawdown_percent;

  /// Orders accepted per one-second window; the N-th order in a window is
  /// rejected once N reaches this value.
  std::int64_t max_orders_per_second{0};

  /// Ceiling on current exposure plus the notional of a new order.
  Decimal max_exposure;

  Decimal stop_loss_percent;
  Decimal take_profit_percent;

  // ---------------------------------------------------------------------------
  // validate()
  // ---------------------------------------------------------------------------
  // @brief  Rejects a limit set containing a negative threshold.
  //
  // @throws ValidationError naming the first offending field.
  // ---------------------------------------------------------------------------
  void validate() const;
};

// Documented fallback limits: position 1000, order 100, daily loss 10000,
// drawdown 20%, 100 orders/s, exposure 100000, stop loss 5%, take profit 10%.
RiskLimits defaultRiskLimits();

}  // namespace domain
}  // namespace tradeguard
