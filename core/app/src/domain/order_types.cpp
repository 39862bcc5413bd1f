#include "tradeguard/domain/order_status.hpp"
#include "tradeguard/domain/order_types.hpp"
#include "tradeguard/domain/errors.hpp"

#include <initializer_list>
#include <string>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus
// -----------------------------------------------------------------------------
const char* toString(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::Pending:         return "pending";
    case S::New:             return "new";
    case S::PartiallyFilled: return "partially_filled";
    case S::Filled:          return "filled";
    case S::Canceled:        return "canceled";
    case S::Rejected:        return "rejected";
  }
  return "unknown";
}

OrderStatus parseOrderStatus(std::string_view name) {
  using S = OrderStatus;
  for (S s : {S::Pending, S::New, S::PartiallyFilled, S::Filled, S::Canceled,
              S::Rejected}) {
    if (name == toString(s)) {
      return s;
    }
  }
  throw ValidationError("status",
                        "unknown order status '" + std::string(name) + "'");
}

bool isTerminal(OrderStatus status) {
  using S = OrderStatus;
  return status == S::Filled ||
         status == S::Canceled ||
         status == S::Rejected;
}

bool canTransition(OrderStatus current, OrderStatus next) {
  using S = OrderStatus;

  switch (current) {
    case S::Pending:
      return next == S::New ||
             next == S::Canceled ||
             next == S::Rejected;

    case S::New:
    case S::PartiallyFilled:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled ||
             next == S::Rejected;

    case S::Filled:
    case S::Canceled:
    case S::Rejected:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// OrderSide / OrderType / TimeInForce
// -----------------------------------------------------------------------------
bool requiresPrice(OrderType type) {
  return type == OrderType::Limit ||
         type == OrderType::StopLimit ||
         type == OrderType::TakeProfit;
}

bool requiresStopPrice(OrderType type) {
  return type == OrderType::StopLoss ||
         type == OrderType::StopLimit ||
         type == OrderType::TrailingStop;
}

int sign(OrderSide side) { return side == OrderSide::Buy ? 1 : -1; }

const char* toString(OrderSide side) {
  switch (side) {
    case OrderSide::Buy:  return "buy";
    case OrderSide::Sell: return "sell";
  }
  return "unknown";
}

const char* toString(OrderType type) {
  switch (type) {
    case OrderType::Market:       return "market";
    case OrderType::Limit:        return "limit";
    case OrderType::StopLoss:     return "stop_loss";
    case OrderType::StopLimit:    return "stop_limit";
    case OrderType::TakeProfit:   return "take_profit";
    case OrderType::TrailingStop: return "trailing_stop";
  }
  return "unknown";
}

const char* toString(TimeInForce tif) {
  switch (tif) {
    case TimeInForce::GTC: return "gtc";
    case TimeInForce::IOC: return "ioc";
    case TimeInForce::FOK: return "fok";
    case TimeInForce::GTD: return "gtd";
  }
  return "unknown";
}

OrderSide parseOrderSide(std::string_view name) {
  if (name == "buy") return OrderSide::Buy;
  if (name == "sell") return OrderSide::Sell;
  throw ValidationError("side", "invalid order side '" + std::string(name) + "'");
}

OrderType parseOrderType(std::string_view name) {
  using T = OrderType;
  for (T t : {T::Market, T::Limit, T::StopLoss, T::StopLimit, T::TakeProfit,
              T::TrailingStop}) {
    if (name == toString(t)) {
      return t;
    }
  }
  throw ValidationError("order_type",
                        "invalid order type '" + std::string(name) + "'");
}

TimeInForce parseTimeInForce(std::string_view name) {
  using F = TimeInForce;
  for (F f : {F::GTC, F::IOC, F::FOK, F::GTD}) {
    if (name == toString(f)) {
      return f;
    }
  }
  throw ValidationError("time_in_force",
                        "invalid time in force '" + std::string(name) + "'");
}

// -----------------------------------------------------------------------------
// Price / Quantity
// -----------------------------------------------------------------------------
Price::Price(Decimal value) : value_(value) {
  if (value.isNegative()) {
    throw ValidationError("price", "price must not be negative, got " +
                                       value.toString());
  }
}

Quantity::Quantity(Decimal value) : value_(value) {
  if (value.isNegative()) {
    throw ValidationError("quantity", "quantity must not be negative, got " +
                                          value.toString());
  }
}

}  // namespace domain
}  // namespace tradeguard
