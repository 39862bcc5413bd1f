#pragma once

#include "tradeguard/domain/decimal.hpp"
#include "tradeguard/domain/order_status.hpp"
#include "tradeguard/domain/order_types.hpp"
#include "tradeguard/time/i_time_provider.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// OrderEventType / OrderEventRecord: the order's audit trail
// -----------------------------------------------------------------------------
//
// @details
// Every successful mutation of an Order appends exactly one record (a fill
// that completes the order appends PartiallyFilled followed by Filled). The
// data payload is a JSON object snapshot of the fields the mutation touched,
// so the log can be shipped to storage without further formatting.
// -----------------------------------------------------------------------------
enum class OrderEventType {
  Created,
  Confirmed,
  PartiallyFilled,
  Filled,
  Canceled,
  Rejected,
  ExchangeOrderIdAssigned,
  LatencyRecorded,
};

const char* toString(OrderEventType type);

struct OrderEventRecord {
  OrderEventType type{OrderEventType::Created};
  Timestamp at{};
  nlohmann::json data;
};

// -----------------------------------------------------------------------------
// OrderParams: constructor input for Order::create()
// -----------------------------------------------------------------------------
// price is ignored for validation purposes on types that do not need one,
// but it is stored as given (0 for Market orders).
// -----------------------------------------------------------------------------
struct OrderParams {
  std::string id;
  std::optional<std::string> client_order_id;
  std::string strategy_id;
  std::string symbol;
  std::string exchange;
  OrderSide side{OrderSide::Buy};
  OrderType order_type{OrderType::Limit};
  TimeInForce time_in_force{TimeInForce::GTC};
  Decimal quantity;
  Decimal price;
  std::optional<Decimal> stop_price;
  std::optional<Timestamp> expires_at;
};

// -----------------------------------------------------------------------------
// Order: one trading intent and its execution accounting
// -----------------------------------------------------------------------------
//
// @brief  Owns its state machine and its append-only event log. There is no
//         way to change a field except through the methods below.
//
// @details
// Lifecycle:
//   create() → Pending → confirm() → New → partialFill()* → Filled
//   cancel() from Pending / New / PartiallyFilled → Canceled
//   reject(reason) from any non-terminal state → Rejected
//
// Invariants held after every call:
//   - filledQuantity() + remainingQuantity() == quantity()
//   - remainingQuantity() is never negative
//   - avgFillPrice() has a value iff filledQuantity() > 0
//   - a terminal order (Filled / Canceled / Rejected) never changes again
//
// Failure semantics:
//   Every mutating method validates first and mutates second. On any throw
//   (ValidationError, InvalidStateTransitionError) the order is unchanged and
//   no event is recorded.
//
// Thread model:
//   Not internally synchronized. An Order is owned by one component at a
//   time (creator, then submission path, then execution); that owner must
//   serialize its own calls. Copies are independent snapshots.
//
// Ownership:
//   Holds a non-owning pointer to the clock given to create(). The clock
//   must outlive the order and all of its copies. Without one, timestamps
//   come from std::chrono::system_clock.
// -----------------------------------------------------------------------------
class Order {
 public:
  // -------------------------------------------------------------------------
  // create(params, clock)
  // -------------------------------------------------------------------------
  // @brief  Validates params and builds a Pending order with one Created
  //         event.
  //
  // @param  clock  Time source for created_at, the GTD expiry check and
  //                every event timestamp. Null means system_clock.
  //
  // @throws ValidationError  Empty id / strategy_id / symbol / exchange,
  //                          quantity <= 0, negative price, missing or
  //                          non-positive price for a type that requires one,
  //                          missing or non-positive stop price for a stop
  //                          type, missing expires_at for GTD, or expires_at
  //                          not after the creation time.
  // -------------------------------------------------------------------------
  static Order create(const OrderParams& params,
                      const ITimeProvider* clock = nullptr);

  // Pending → New. @throws InvalidStateTransitionError otherwise.
  void confirm();

  // -------------------------------------------------------------------------
  // partialFill(fill_qty, fill_price, commission)
  // -------------------------------------------------------------------------
  // @brief  Applies one execution to the order.
  //
  // @param  fill_qty    Executed quantity, > 0 and <= remainingQuantity().
  // @param  fill_price  Execution price, > 0.
  // @param  commission  Fee charged for this fill. The amount is added to
  //                     the running total; the asset replaces the previous
  //                     one.
  //
  // @details
  //   filled'  = filled + fill_qty
  //   avg'     = (avg * filled + fill_price * fill_qty) / filled'
  //   status'  = Filled if remaining' == 0, else PartiallyFilled
  // Appends PartiallyFilled (post-fill snapshot), and Filled on completion.
  //
  // @throws InvalidStateTransitionError  Not New / PartiallyFilled, or
  //                                      fill_qty > remainingQuantity().
  // @throws ValidationError              Non-positive fill_qty / fill_price.
  // -------------------------------------------------------------------------
  void partialFill(Quantity fill_qty, Price fill_price,
                   const Commission& commission);

  // @throws InvalidStateTransitionError when Filled, Canceled or Rejected.
  void cancel();

  // Any non-terminal state → Rejected, reason stored as errorMessage().
  // @throws InvalidStateTransitionError when already terminal.
  void reject(const std::string& reason);

  // Records the venue's identifier once the order is acknowledged.
  // @throws ValidationError on an empty id.
  // @throws InvalidStateTransitionError if one was already assigned, or the
  //         order is terminal.
  void setExchangeOrderId(const std::string& exchange_order_id);

  // Records the measured processing latency.
  // @throws InvalidStateTransitionError if the order is terminal.
  void setLatency(std::chrono::nanoseconds latency);

  bool isActive() const;
  bool isFilled() const { return status_ == OrderStatus::Filled; }
  bool isCanceled() const { return status_ == OrderStatus::Canceled; }
  bool isRejected() const { return status_ == OrderStatus::Rejected; }
  bool isTerminal() const { return domain::isTerminal(status_); }

  const std::string& id() const { return id_; }
  const std::optional<std::string>& clientOrderId() const {
    return client_order_id_;
  }
  const std::string& strategyId() const { return strategy_id_; }
  const std::string& symbol() const { return symbol_; }
  const std::string& exchange() const { return exchange_; }
  OrderSide side() const { return side_; }
  OrderType orderType() const { return order_type_; }
  TimeInForce timeInForce() const { return time_in_force_; }
  Quantity quantity() const { return quantity_; }
  Price price() const { return price_; }
  const std::optional<Price>& stopPrice() const { return stop_price_; }

  // -------------------------------------------------------------------------
  // referencePrice()
  // -------------------------------------------------------------------------
  // @brief  The price the order is valued at before it executes.
  //
  // @details
  //   Market                      std::nullopt (valued at execution)
  //   price() > 0                 price()
  //   stop types with price 0     stopPrice()
  // -------------------------------------------------------------------------
  std::optional<Price> referencePrice() const;
  OrderStatus status() const { return status_; }
  Quantity filledQuantity() const { return filled_quantity_; }
  Quantity remainingQuantity() const { return remaining_quantity_; }
  const std::optional<Price>& avgFillPrice() const { return avg_fill_price_; }
  const Commission& commission() const { return commission_; }
  Timestamp createdAt() const { return created_at_; }
  Timestamp updatedAt() const { return updated_at_; }
  const std::optional<Timestamp>& expiresAt() const { return expires_at_; }
  const std::string& exchangeOrderId() const { return exchange_order_id_; }
  const std::string& errorMessage() const { return error_message_; }
  std::chrono::nanoseconds latency() const { return latency_; }

  // Read-only view of the audit trail, oldest first.
  const std::vector<OrderEventRecord>& events() const { return events_; }

  // Full snapshot: enums as wire names, decimals as strings, times as
  // epoch milliseconds.
  nlohmann::json toJson() const;

 private:
  Order() = default;

  // Guards a status change against canTransition(); throws without touching
  // any field when the transition is illegal.
  void requireTransition(OrderStatus next, const char* operation) const;

  // Appends to events_ and stamps updated_at_.
  void record(OrderEventType type, nlohmann::json data);

  Timestamp now() const;

  std::string id_;
  std::optional<std::string> client_order_id_;
  std::string strategy_id_;
  std::string symbol_;
  std::string exchange_;
  OrderSide side_{OrderSide::Buy};
  OrderType order_type_{OrderType::Limit};
  TimeInForce time_in_force_{TimeInForce::GTC};
  Quantity quantity_;
  Price price_;
  std::optional<Price> stop_price_;
  OrderStatus status_{OrderStatus::Pending};
  Quantity filled_quantity_;
  Quantity remaining_quantity_;
  std::optional<Price> avg_fill_price_;
  Commission commission_;
  Timestamp created_at_{};
  Timestamp updated_at_{};
  std::optional<Timestamp> expires_at_;
  std::string exchange_order_id_;
  std::string error_message_;
  std::chrono::nanoseconds latency_{0};
  std::vector<OrderEventRecord> events_;
  const ITimeProvider* clock_{nullptr};
};

}  // namespace domain
}  // namespace tradeguard
