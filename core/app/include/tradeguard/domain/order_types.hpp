#pragma once

#include "tradeguard/domain/decimal.hpp"

#include <string>
#include <string_view>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// OrderSide
// -----------------------------------------------------------------------------
// Buy adds to a long position, Sell reduces it (or builds a short).
// -----------------------------------------------------------------------------
enum class OrderSide {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderType
// -----------------------------------------------------------------------------
// @details
//   requiresPrice():     Limit, StopLimit, TakeProfit
//   requiresStopPrice(): StopLoss, StopLimit, TrailingStop
// A Market order carries price 0 and has no notional until a mark price is
// supplied.
// -----------------------------------------------------------------------------
enum class OrderType {
  Market,
  Limit,
  StopLoss,
  StopLimit,
  TakeProfit,
  TrailingStop,
};

// -----------------------------------------------------------------------------
// TimeInForce
// -----------------------------------------------------------------------------
// GTC good-til-canceled, IOC immediate-or-cancel, FOK fill-or-kill,
// GTD good-til-date (requires an expiry timestamp on the order).
// -----------------------------------------------------------------------------
enum class TimeInForce {
  GTC,
  IOC,
  FOK,
  GTD,
};

bool requiresPrice(OrderType type);
bool requiresStopPrice(OrderType type);

// +1 for Buy, -1 for Sell. Used to build signed position deltas.
int sign(OrderSide side);

const char* toString(OrderSide side);
const char* toString(OrderType type);
const char* toString(TimeInForce tif);

// Parsers accept the lower_snake_case wire names ("buy", "stop_limit",
// "gtd"). @throws ValidationError on an unknown name.
OrderSide parseOrderSide(std::string_view name);
OrderType parseOrderType(std::string_view name);
TimeInForce parseTimeInForce(std::string_view name);

// -----------------------------------------------------------------------------
// Price / Quantity
// -----------------------------------------------------------------------------
//
// @brief  Validated non-negative Decimal wrappers.
//
// @details
// Construction from a negative Decimal throws ValidationError. Zero is
// allowed for both: a Market order has price 0, and a fresh order has
// filled quantity 0. Positivity of an order's quantity is enforced by
// Order::create, not here.
// -----------------------------------------------------------------------------
class Price {
 public:
  Price() = default;
  explicit Price(Decimal value);

  Decimal value() const { return value_; }
  bool isZero() const { return value_.isZero(); }

  friend bool operator==(Price a, Price b) { return a.value_ == b.value_; }
  friend bool operator!=(Price a, Price b) { return a.value_ != b.value_; }

 private:
  Decimal value_;
};

class Quantity {
 public:
  Quantity() = default;
  explicit Quantity(Decimal value);

  Decimal value() const { return value_; }
  bool isZero() const { return value_.isZero(); }

  friend bool operator==(Quantity a, Quantity b) {
    return a.value_ == b.value_;
  }
  friend bool operator!=(Quantity a, Quantity b) {
    return a.value_ != b.value_;
  }

 private:
  Decimal value_;
};

// -----------------------------------------------------------------------------
// Commission
// -----------------------------------------------------------------------------
// Fee amount plus the asset it is settled in (e.g. "USDT").
// -----------------------------------------------------------------------------
struct Commission {
  Decimal amount;
  std::string asset;
};

}  // namespace domain
}  // namespace tradeguard
