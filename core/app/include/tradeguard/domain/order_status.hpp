#pragma once

#include <string>
#include <string_view>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an Order can occupy.
//
// @details
// Legal transitions, enforced by the Order entity itself:
//
//   Pending ──confirm──> New ──fill──> PartiallyFilled ──fill──> Filled
//      │                  │  └─────────────fill (complete)──────────▲
//      │                  │                   │
//      ├──cancel──────────┴───────────────────┴──cancel──> Canceled
//      └──reject──> Rejected   (also from New / PartiallyFilled)
//
// Terminal states: Filled, Canceled, Rejected. A terminal order is frozen.
//
// Wire names are lower_snake_case ("partially_filled") and are used by the
// JSON snapshots and the IPC escalation stream.
//
// Thread model:
//   Plain enum. Safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,          // Created and validated, not yet acknowledged
  New,              // Acknowledged, resting, nothing filled yet
  PartiallyFilled,  // Some quantity filled, remainder open
  Filled,           // Fully filled, terminal
  Canceled,         // Canceled, terminal
  Rejected,         // Rejected by risk, venue or validation, terminal
};

const char* toString(OrderStatus status);

// @throws ValidationError on an unknown name.
OrderStatus parseOrderStatus(std::string_view name);

// -----------------------------------------------------------------------------
// isTerminal(status)
// -----------------------------------------------------------------------------
// @brief  True for Filled, Canceled and Rejected.
// -----------------------------------------------------------------------------
bool isTerminal(OrderStatus status);

// -----------------------------------------------------------------------------
// canTransition(current, next)
// -----------------------------------------------------------------------------
// @brief  Validates a proposed status change against the graph above.
//
// @details
//   Pending         → New, Canceled, Rejected
//   New             → PartiallyFilled, Filled, Canceled, Rejected
//   PartiallyFilled → PartiallyFilled, Filled, Canceled, Rejected
//   Filled / Canceled / Rejected → (none)
//
// Pure function, no side effects.
// -----------------------------------------------------------------------------
bool canTransition(OrderStatus current, OrderStatus next);

}  // namespace domain
}  // namespace tradeguard
