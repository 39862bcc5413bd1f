#include "tradeguard/domain/order.hpp"
#include "tradeguard/domain/errors.hpp"

#include <utility>

namespace tradeguard {
namespace domain {

namespace {

void requireNonEmpty(const std::string& value, const char* field) {
  if (value.empty()) {
    throw ValidationError(field, std::string(field) + " is required");
  }
}

}  // namespace

const char* toString(OrderEventType type) {
  using E = OrderEventType;
  switch (type) {
    case E::Created:                 return "created";
    case E::Confirmed:               return "confirmed";
    case E::PartiallyFilled:         return "partially_filled";
    case E::Filled:                  return "filled";
    case E::Canceled:                return "canceled";
    case E::Rejected:                return "rejected";
    case E::ExchangeOrderIdAssigned: return "exchange_order_id_assigned";
    case E::LatencyRecorded:         return "latency_recorded";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// create: validate every parameter, then build the Pending order
// -----------------------------------------------------------------------------
Order Order::create(const OrderParams& params,
                    const ITimeProvider* clock) {
  requireNonEmpty(params.id, "id");
  requireNonEmpty(params.strategy_id, "strategy_id");
  requireNonEmpty(params.symbol, "symbol");
  requireNonEmpty(params.exchange, "exchange");

  if (!params.quantity.isPositive()) {
    throw ValidationError("quantity", "quantity must be positive, got " +
                                          params.quantity.toString());
  }
  if (params.price.isNegative()) {
    throw ValidationError("price", "price must not be negative, got " +
                                       params.price.toString());
  }
  if (requiresPrice(params.order_type) && !params.price.isPositive()) {
    throw ValidationError("price", std::string("price is required for ") +
                                       toString(params.order_type) +
                                       " orders");
  }
  if (requiresStopPrice(params.order_type) &&
      (!params.stop_price || !params.stop_price->isPositive())) {
    throw ValidationError("stop_price",
                          std::string("stop price is required for ") +
                              toString(params.order_type) + " orders");
  }
  if (params.stop_price && params.stop_price->isNegative()) {
    throw ValidationError("stop_price", "stop price must not be negative");
  }

  const Timestamp now =
      clock != nullptr ? clock->now() : std::chrono::system_clock::now();

  if (params.time_in_force == TimeInForce::GTD) {
    if (!params.expires_at) {
      throw ValidationError("expires_at",
                            "expires_at is required for GTD orders");
    }
    if (*params.expires_at <= now) {
      throw ValidationError("expires_at",
                            "expires_at must be in the future for GTD orders");
    }
  }

  Order order;
  order.clock_ = clock;
  order.id_ = params.id;
  order.client_order_id_ = params.client_order_id;
  order.strategy_id_ = params.strategy_id;
  order.symbol_ = params.symbol;
  order.exchange_ = params.exchange;
  order.side_ = params.side;
  order.order_type_ = params.order_type;
  order.time_in_force_ = params.time_in_force;
  order.quantity_ = Quantity(params.quantity);
  order.price_ = Price(params.price);
  if (params.stop_price) {
    order.stop_price_ = Price(*params.stop_price);
  }
  order.status_ = OrderStatus::Pending;
  order.filled_quantity_ = Quantity(Decimal(0));
  order.remaining_quantity_ = order.quantity_;
  order.created_at_ = now;
  order.updated_at_ = now;
  order.expires_at_ = params.expires_at;

  order.record(OrderEventType::Created, order.toJson());
  return order;
}

// -----------------------------------------------------------------------------
// confirm: Pending → New
// -----------------------------------------------------------------------------
void Order::confirm() {
  if (status_ != OrderStatus::Pending) {
    throw InvalidStateTransitionError(toString(status_), "confirm");
  }
  status_ = OrderStatus::New;
  record(OrderEventType::Confirmed, {{"status", toString(status_)}});
}

// -----------------------------------------------------------------------------
// partialFill: weighted average, commission accumulation, Filled on zero
// -----------------------------------------------------------------------------
void Order::partialFill(Quantity fill_qty, Price fill_price,
                        const Commission& commission) {
  if (status_ != OrderStatus::New &&
      status_ != OrderStatus::PartiallyFilled) {
    throw InvalidStateTransitionError(toString(status_), "fill");
  }
  if (fill_qty.isZero()) {
    throw ValidationError("fill_quantity", "fill quantity must be positive");
  }
  if (fill_price.isZero()) {
    throw ValidationError("fill_price", "fill price must be positive");
  }
  if (fill_qty.value() > remaining_quantity_.value()) {
    throw InvalidStateTransitionError(
        toString(status_), "fill",
        "fill quantity " + fill_qty.value().toString() +
            " exceeds remaining quantity " +
            remaining_quantity_.value().toString());
  }
  if (commission.amount.isNegative()) {
    throw ValidationError("commission", "commission must not be negative");
  }

  Decimal old_filled = filled_quantity_.value();
  Decimal new_filled = old_filled + fill_qty.value();
  Decimal old_notional =
      avg_fill_price_ ? avg_fill_price_->value() * old_filled : Decimal(0);
  Decimal new_avg =
      (old_notional + fill_price.value() * fill_qty.value()) / new_filled;

  filled_quantity_ = Quantity(new_filled);
  remaining_quantity_ = Quantity(quantity_.value() - new_filled);
  avg_fill_price_ = Price(new_avg);
  commission_.amount += commission.amount;
  commission_.asset = commission.asset;
  status_ = remaining_quantity_.isZero() ? OrderStatus::Filled
                                         : OrderStatus::PartiallyFilled;

  record(OrderEventType::PartiallyFilled,
         {{"fill_quantity", fill_qty.value().toString()},
          {"fill_price", fill_price.value().toString()},
          {"filled_quantity", filled_quantity_.value().toString()},
          {"remaining_quantity", remaining_quantity_.value().toString()},
          {"avg_fill_price", new_avg.toString()},
          {"commission", commission_.amount.toString()},
          {"commission_asset", commission_.asset},
          {"status", toString(status_)}});

  if (status_ == OrderStatus::Filled) {
    record(OrderEventType::Filled,
           {{"filled_quantity", filled_quantity_.value().toString()},
            {"avg_fill_price", new_avg.toString()}});
  }
}

// -----------------------------------------------------------------------------
// cancel / reject
// -----------------------------------------------------------------------------
void Order::cancel() {
  requireTransition(OrderStatus::Canceled, "cancel");
  OrderStatus previous = status_;
  status_ = OrderStatus::Canceled;
  record(OrderEventType::Canceled,
         {{"previous_status", toString(previous)},
          {"filled_quantity", filled_quantity_.value().toString()},
          {"remaining_quantity", remaining_quantity_.value().toString()}});
}

void Order::reject(const std::string& reason) {
  requireTransition(OrderStatus::Rejected, "reject");
  OrderStatus previous = status_;
  status_ = OrderStatus::Rejected;
  error_message_ = reason;
  record(OrderEventType::Rejected,
         {{"previous_status", toString(previous)}, {"reason", reason}});
}

// -----------------------------------------------------------------------------
// Metadata setters
// -----------------------------------------------------------------------------
void Order::setExchangeOrderId(const std::string& exchange_order_id) {
  if (isTerminal()) {
    throw InvalidStateTransitionError(toString(status_),
                                      "set exchange order id");
  }
  requireNonEmpty(exchange_order_id, "exchange_order_id");
  if (!exchange_order_id_.empty()) {
    throw InvalidStateTransitionError(
        toString(status_), "set exchange order id",
        "already assigned " + exchange_order_id_);
  }
  exchange_order_id_ = exchange_order_id;
  record(OrderEventType::ExchangeOrderIdAssigned,
         {{"exchange_order_id", exchange_order_id_}});
}

void Order::setLatency(std::chrono::nanoseconds latency) {
  if (isTerminal()) {
    throw InvalidStateTransitionError(toString(status_), "set latency");
  }
  latency_ = latency;
  record(OrderEventType::LatencyRecorded,
         {{"latency_ns", static_cast<std::int64_t>(latency_.count())}});
}

std::optional<Price> Order::referencePrice() const {
  if (order_type_ == OrderType::Market) {
    return std::nullopt;
  }
  if (!price_.isZero()) {
    return price_;
  }
  return stop_price_;
}

bool Order::isActive() const {
  return status_ == OrderStatus::New ||
         status_ == OrderStatus::PartiallyFilled;
}

// -----------------------------------------------------------------------------
// toJson
// -----------------------------------------------------------------------------
nlohmann::json Order::toJson() const {
  nlohmann::json j;
  j["id"] = id_;
  j["client_order_id"] =
      client_order_id_ ? nlohmann::json(*client_order_id_) : nlohmann::json();
  j["strategy_id"] = strategy_id_;
  j["symbol"] = symbol_;
  j["exchange"] = exchange_;
  j["side"] = toString(side_);
  j["order_type"] = toString(order_type_);
  j["time_in_force"] = toString(time_in_force_);
  j["quantity"] = quantity_.value().toString();
  j["price"] = price_.value().toString();
  j["stop_price"] = stop_price_ ? nlohmann::json(stop_price_->value().toString())
                                : nlohmann::json();
  j["status"] = toString(status_);
  j["filled_quantity"] = filled_quantity_.value().toString();
  j["remaining_quantity"] = remaining_quantity_.value().toString();
  j["avg_fill_price"] = avg_fill_price_
                            ? nlohmann::json(avg_fill_price_->value().toString())
                            : nlohmann::json();
  j["commission"] = commission_.amount.toString();
  j["commission_asset"] = commission_.asset;
  j["created_at"] = timestamp_to_ms(created_at_);
  j["updated_at"] = timestamp_to_ms(updated_at_);
  j["expires_at"] = expires_at_ ? nlohmann::json(timestamp_to_ms(*expires_at_))
                                : nlohmann::json();
  j["exchange_order_id"] = exchange_order_id_;
  j["error_message"] = error_message_;
  j["latency_ns"] = static_cast<std::int64_t>(latency_.count());
  return j;
}

// -----------------------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------------------
void Order::requireTransition(OrderStatus next, const char* operation) const {
  if (!canTransition(status_, next)) {
    throw InvalidStateTransitionError(toString(status_), operation);
  }
}

void Order::record(OrderEventType type, nlohmann::json data) {
  const Timestamp at = now();
  updated_at_ = at;
  events_.push_back(OrderEventRecord{type, at, std::move(data)});
}

Timestamp Order::now() const {
  return clock_ != nullptr ? clock_->now() : std::chrono::system_clock::now();
}

}  // namespace domain
}  // namespace tradeguard
