#pragma once

#include "tradeguard/domain/decimal.hpp"

#include <string>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// Position: one strategy's holding in one instrument
// -----------------------------------------------------------------------------
//
// @brief  Snapshot read by the risk checker for pre-trade position limits
//         and post-trade position validation.
//
// @details
// Sign convention for net_quantity:
//   positive → long  (we own the instrument)
//   negative → short (we owe the instrument)
//   zero     → flat  (no position)
//
// average_price is the weighted average entry cost of the current position
// and mark_price the latest valuation price. unrealized_pnl is computed by
// whoever supplies the snapshot; a negative value is an open loss and is
// compared against RiskLimits::max_daily_loss.
//
// margin is the collateral currently posted; maintenance_margin is the
// minimum the venue requires. margin < maintenance_margin is a violation.
//
// Thread model:
//   Plain value type. IPositionLookup implementations hand out copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string strategy_id;
  std::string symbol;           // Instrument identifier (e.g. "BTC/USDT")
  Decimal net_quantity;         // Signed: +long, -short, 0=flat
  Decimal average_price;        // Weighted avg entry price of current position
  Decimal mark_price;
  Decimal unrealized_pnl;
  Decimal margin;
  Decimal maintenance_margin;

  // Absolute position size regardless of direction.
  Decimal size() const { return net_quantity.abs(); }
};

}  // namespace domain
}  // namespace tradeguard
