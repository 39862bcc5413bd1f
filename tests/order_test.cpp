// =============================================================================
// order_test.cpp
// =============================================================================
// Unit tests for tradeguard::domain::Order and its value types.
//
// Validates:
//   - create(): Pending, nothing filled, exactly one Created event, and
//     every parameter rule (ids, quantity, price / stop price by type,
//     GTD expiry)
//   - State machine: confirm once from Pending, cancel from the live
//     states, reject from any non-terminal state, frozen terminal orders
//   - partialFill(): weighted average, commission accumulation, Filled on
//     completion, overfill refused with the order unchanged
//   - Metadata: exchange order id once, latency, toJson snapshot
//   - Enum wire names and parsers, Price / Quantity sign checks
//   - An injected clock stamps creation, audit events and the GTD check
//   - referencePrice(): limit price, stop trigger, none for Market orders
// =============================================================================

#include "tradeguard/domain/errors.hpp"
#include "tradeguard/domain/order.hpp"
#include "tradeguard/domain/order_status.hpp"
#include "tradeguard/domain/order_types.hpp"
#include "tradeguard/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using tradeguard::InvalidStateTransitionError;
using tradeguard::ValidationError;
using tradeguard::domain::Commission;
using tradeguard::domain::Decimal;
using tradeguard::domain::Order;
using tradeguard::domain::OrderEventType;
using tradeguard::domain::OrderParams;
using tradeguard::domain::OrderSide;
using tradeguard::domain::OrderStatus;
using tradeguard::domain::OrderType;
using tradeguard::domain::Price;
using tradeguard::domain::Quantity;
using tradeguard::domain::TimeInForce;

// Helper: a valid limit buy of 0.1 BTC/USDT @ 50000.
static OrderParams makeParams() {
  OrderParams p;
  p.id = "ord-1";
  p.strategy_id = "alpha";
  p.symbol = "BTC/USDT";
  p.exchange = "binance";
  p.side = OrderSide::Buy;
  p.order_type = OrderType::Limit;
  p.quantity = Decimal::parse("0.1");
  p.price = Decimal(50000);
  return p;
}

static Commission fee(const char* amount) {
  return Commission{Decimal::parse(amount), "USDT"};
}

class OrderTest : public ::testing::Test {
 protected:
  // A confirmed (New) order ready for fills.
  Order makeLiveOrder() {
    Order order = Order::create(makeParams());
    order.confirm();
    return order;
  }
};

// -----------------------------------------------------------------------------
// 1. create() produces a Pending order with one Created event.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, CreateProducesPendingOrder) {
  Order order = Order::create(makeParams());

  EXPECT_EQ(order.status(), OrderStatus::Pending);
  EXPECT_TRUE(order.filledQuantity().isZero());
  EXPECT_EQ(order.remainingQuantity(), order.quantity());
  EXPECT_FALSE(order.avgFillPrice().has_value());
  EXPECT_FALSE(order.isActive());
  EXPECT_FALSE(order.isTerminal());

  ASSERT_EQ(order.events().size(), 1u);
  EXPECT_EQ(order.events()[0].type, OrderEventType::Created);
  EXPECT_EQ(order.events()[0].data["id"], "ord-1");
}

// -----------------------------------------------------------------------------
// 2. Every parameter rule in create() throws ValidationError.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, CreateRejectsInvalidParams) {
  auto expectInvalid = [](OrderParams p, const std::string& field) {
    try {
      Order::create(p);
      FAIL() << "expected ValidationError on " << field;
    } catch (const ValidationError& e) {
      EXPECT_EQ(e.field(), field);
    }
  };

  OrderParams p = makeParams();
  p.strategy_id.clear();
  expectInvalid(p, "strategy_id");

  p = makeParams();
  p.symbol.clear();
  expectInvalid(p, "symbol");

  p = makeParams();
  p.quantity = Decimal(0);
  expectInvalid(p, "quantity");

  p = makeParams();
  p.quantity = Decimal::parse("-1");
  expectInvalid(p, "quantity");

  p = makeParams();
  p.price = Decimal(0);
  expectInvalid(p, "price");

  p = makeParams();
  p.order_type = OrderType::StopLimit;
  expectInvalid(p, "stop_price");

  p = makeParams();
  p.order_type = OrderType::StopLoss;
  p.stop_price = Decimal(0);
  expectInvalid(p, "stop_price");

  p = makeParams();
  p.time_in_force = TimeInForce::GTD;
  expectInvalid(p, "expires_at");

  p = makeParams();
  p.time_in_force = TimeInForce::GTD;
  p.expires_at = std::chrono::system_clock::now() - std::chrono::minutes(1);
  expectInvalid(p, "expires_at");
}

// -----------------------------------------------------------------------------
// 3. Market orders need no price; GTD orders with a future expiry are fine.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, CreateAcceptsMarketAndGtdOrders) {
  OrderParams market = makeParams();
  market.order_type = OrderType::Market;
  market.price = Decimal(0);
  EXPECT_NO_THROW(Order::create(market));

  OrderParams gtd = makeParams();
  gtd.time_in_force = TimeInForce::GTD;
  gtd.expires_at = std::chrono::system_clock::now() + std::chrono::hours(1);
  Order order = Order::create(gtd);
  ASSERT_TRUE(order.expiresAt().has_value());

  OrderParams stop = makeParams();
  stop.order_type = OrderType::StopLimit;
  stop.stop_price = Decimal(49000);
  EXPECT_NO_THROW(Order::create(stop));
}

// -----------------------------------------------------------------------------
// 4. confirm() is valid exactly once, from Pending.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, ConfirmOnlyFromPending) {
  Order order = Order::create(makeParams());
  order.confirm();
  EXPECT_EQ(order.status(), OrderStatus::New);
  EXPECT_TRUE(order.isActive());

  EXPECT_THROW(order.confirm(), InvalidStateTransitionError);
  EXPECT_EQ(order.status(), OrderStatus::New);
  EXPECT_EQ(order.events().size(), 2u);
}

// -----------------------------------------------------------------------------
// 5. Two fills complete the order with an exact weighted average.
//    0.1 @ 50000, fills 0.05 @ 50100 and 0.05 @ 50200 → avg 50150.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, PartialFillsCompleteOrder) {
  Order order = makeLiveOrder();

  order.partialFill(Quantity(Decimal::parse("0.05")), Price(Decimal(50100)),
                    fee("2.505"));
  EXPECT_EQ(order.status(), OrderStatus::PartiallyFilled);
  EXPECT_EQ(order.filledQuantity().value(), Decimal::parse("0.05"));
  EXPECT_EQ(order.remainingQuantity().value(), Decimal::parse("0.05"));
  ASSERT_TRUE(order.avgFillPrice().has_value());
  EXPECT_EQ(order.avgFillPrice()->value(), Decimal(50100));

  order.partialFill(Quantity(Decimal::parse("0.05")), Price(Decimal(50200)),
                    fee("2.51"));
  EXPECT_EQ(order.status(), OrderStatus::Filled);
  EXPECT_TRUE(order.isFilled());
  EXPECT_TRUE(order.isTerminal());
  EXPECT_TRUE(order.remainingQuantity().isZero());
  EXPECT_EQ(order.filledQuantity(), order.quantity());
  EXPECT_EQ(order.avgFillPrice()->value(), Decimal(50150));
  EXPECT_EQ(order.commission().amount, Decimal::parse("5.015"));
  EXPECT_EQ(order.commission().asset, "USDT");

  // Created, Confirmed, PartiallyFilled, PartiallyFilled, Filled.
  ASSERT_EQ(order.events().size(), 5u);
  EXPECT_EQ(order.events().back().type, OrderEventType::Filled);
}

// -----------------------------------------------------------------------------
// 6. filled + remaining == quantity after every fill, and the average stays
//    between the lowest and highest fill price.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, FillSequenceKeepsQuantityInvariant) {
  OrderParams p = makeParams();
  p.quantity = Decimal(10);
  Order order = Order::create(p);
  order.confirm();

  const int prices[] = {100, 104, 97, 101};
  const char* sizes[] = {"1.5", "2.25", "3", "3.25"};
  for (int i = 0; i < 4; ++i) {
    order.partialFill(Quantity(Decimal::parse(sizes[i])),
                      Price(Decimal(prices[i])), fee("0"));
    EXPECT_EQ(order.filledQuantity().value() +
                  order.remainingQuantity().value(),
              order.quantity().value());
    EXPECT_GE(order.avgFillPrice()->value(), Decimal(97));
    EXPECT_LE(order.avgFillPrice()->value(), Decimal(104));
  }
  EXPECT_TRUE(order.isFilled());
}

// -----------------------------------------------------------------------------
// 7. An overfill is refused and the order is left exactly as it was.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, OverfillLeavesOrderUnchanged) {
  Order order = makeLiveOrder();
  order.partialFill(Quantity(Decimal::parse("0.04")), Price(Decimal(50000)),
                    fee("1"));
  const auto events_before = order.events().size();

  EXPECT_THROW(order.partialFill(Quantity(Decimal::parse("0.07")),
                                 Price(Decimal(50000)), fee("1")),
               InvalidStateTransitionError);

  EXPECT_EQ(order.status(), OrderStatus::PartiallyFilled);
  EXPECT_EQ(order.filledQuantity().value(), Decimal::parse("0.04"));
  EXPECT_EQ(order.remainingQuantity().value(), Decimal::parse("0.06"));
  EXPECT_EQ(order.commission().amount, Decimal(1));
  EXPECT_EQ(order.events().size(), events_before);
}

// -----------------------------------------------------------------------------
// 8. Fills are refused before confirmation and with zero size or price.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, FillPreconditions) {
  Order pending = Order::create(makeParams());
  EXPECT_THROW(pending.partialFill(Quantity(Decimal::parse("0.01")),
                                   Price(Decimal(50000)), fee("0")),
               InvalidStateTransitionError);

  Order order = makeLiveOrder();
  EXPECT_THROW(order.partialFill(Quantity(Decimal(0)), Price(Decimal(50000)),
                                 fee("0")),
               ValidationError);
  EXPECT_THROW(order.partialFill(Quantity(Decimal::parse("0.01")),
                                 Price(Decimal(0)), fee("0")),
               ValidationError);
  EXPECT_THROW(order.partialFill(Quantity(Decimal::parse("0.01")),
                                 Price(Decimal(50000)), fee("-1")),
               ValidationError);
  EXPECT_TRUE(order.filledQuantity().isZero());
}

// -----------------------------------------------------------------------------
// 9. cancel() succeeds from Pending, New and PartiallyFilled.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, CancelFromLiveStates) {
  Order pending = Order::create(makeParams());
  pending.cancel();
  EXPECT_TRUE(pending.isCanceled());

  Order live = makeLiveOrder();
  live.cancel();
  EXPECT_TRUE(live.isCanceled());

  Order partial = makeLiveOrder();
  partial.partialFill(Quantity(Decimal::parse("0.05")), Price(Decimal(50000)),
                      fee("0"));
  partial.cancel();
  EXPECT_TRUE(partial.isCanceled());
  EXPECT_EQ(partial.filledQuantity().value(), Decimal::parse("0.05"));
  EXPECT_EQ(partial.events().back().type, OrderEventType::Canceled);
}

// -----------------------------------------------------------------------------
// 10. Terminal orders are frozen: transitions and metadata setters throw.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, TerminalOrdersAreFrozen) {
  Order filled = makeLiveOrder();
  filled.partialFill(Quantity(Decimal::parse("0.1")), Price(Decimal(50000)),
                     fee("0"));
  ASSERT_TRUE(filled.isFilled());
  const auto filled_events = filled.events().size();
  EXPECT_THROW(filled.cancel(), InvalidStateTransitionError);
  EXPECT_THROW(filled.reject("late"), InvalidStateTransitionError);
  EXPECT_THROW(filled.setExchangeOrderId("BN-9"), InvalidStateTransitionError);
  EXPECT_THROW(filled.setLatency(std::chrono::microseconds(5)),
               InvalidStateTransitionError);
  EXPECT_TRUE(filled.exchangeOrderId().empty());
  EXPECT_EQ(filled.latency(), std::chrono::nanoseconds(0));
  EXPECT_EQ(filled.events().size(), filled_events);

  Order canceled = Order::create(makeParams());
  canceled.cancel();
  EXPECT_THROW(canceled.cancel(), InvalidStateTransitionError);
  EXPECT_THROW(canceled.confirm(), InvalidStateTransitionError);

  Order rejected = Order::create(makeParams());
  rejected.reject("risk");
  EXPECT_THROW(rejected.cancel(), InvalidStateTransitionError);
  EXPECT_THROW(rejected.setLatency(std::chrono::microseconds(5)),
               InvalidStateTransitionError);
  EXPECT_THROW(canceled.setExchangeOrderId("BN-10"),
               InvalidStateTransitionError);
  EXPECT_EQ(rejected.status(), OrderStatus::Rejected);
  EXPECT_EQ(rejected.events().size(), 2u);
}

// -----------------------------------------------------------------------------
// 11. reject() stores the reason and records the previous state.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, RejectStoresReason) {
  Order order = Order::create(makeParams());
  order.reject("exposure limit");

  EXPECT_TRUE(order.isRejected());
  EXPECT_EQ(order.errorMessage(), "exposure limit");
  EXPECT_EQ(order.events().back().type, OrderEventType::Rejected);
  EXPECT_EQ(order.events().back().data["previous_status"], "pending");

  Order live = makeLiveOrder();
  live.reject("venue refused");
  EXPECT_TRUE(live.isRejected());
}

// -----------------------------------------------------------------------------
// 12. Exchange order id is assigned once; latency is recorded.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, ExchangeOrderIdAndLatency) {
  Order order = makeLiveOrder();

  EXPECT_THROW(order.setExchangeOrderId(""), ValidationError);
  order.setExchangeOrderId("BN-123");
  EXPECT_EQ(order.exchangeOrderId(), "BN-123");
  EXPECT_THROW(order.setExchangeOrderId("BN-456"),
               InvalidStateTransitionError);

  order.setLatency(std::chrono::microseconds(850));
  EXPECT_EQ(order.latency(), std::chrono::nanoseconds(850'000));
  EXPECT_EQ(order.events().back().type, OrderEventType::LatencyRecorded);
}

// -----------------------------------------------------------------------------
// 13. toJson() uses wire names and decimal strings.
// -----------------------------------------------------------------------------
TEST_F(OrderTest, ToJsonSnapshot) {
  Order order = makeLiveOrder();
  auto j = order.toJson();

  EXPECT_EQ(j["id"], "ord-1");
  EXPECT_EQ(j["side"], "buy");
  EXPECT_EQ(j["order_type"], "limit");
  EXPECT_EQ(j["time_in_force"], "gtc");
  EXPECT_EQ(j["status"], "new");
  EXPECT_EQ(j["quantity"], "0.1");
  EXPECT_EQ(j["price"], "50000");
  EXPECT_TRUE(j["avg_fill_price"].is_null());
}

// -----------------------------------------------------------------------------
// 14. Enum wire names round-trip through the parsers; unknown names throw.
// -----------------------------------------------------------------------------
TEST(OrderTypesTest, WireNamesAndParsers) {
  using namespace tradeguard::domain;

  EXPECT_EQ(parseOrderSide("sell"), OrderSide::Sell);
  EXPECT_EQ(parseOrderType("stop_limit"), OrderType::StopLimit);
  EXPECT_EQ(parseTimeInForce("gtd"), TimeInForce::GTD);
  EXPECT_EQ(parseOrderStatus("partially_filled"), OrderStatus::PartiallyFilled);
  EXPECT_STREQ(toString(OrderType::TrailingStop), "trailing_stop");

  EXPECT_THROW(parseOrderSide("hold"), ValidationError);
  EXPECT_THROW(parseOrderType("iceberg"), ValidationError);
  EXPECT_THROW(parseTimeInForce("day"), ValidationError);

  EXPECT_TRUE(requiresPrice(OrderType::TakeProfit));
  EXPECT_FALSE(requiresPrice(OrderType::Market));
  EXPECT_TRUE(requiresStopPrice(OrderType::TrailingStop));
  EXPECT_EQ(sign(OrderSide::Sell), -1);
}

// -----------------------------------------------------------------------------
// 15. Price and Quantity refuse negative values but allow zero.
// -----------------------------------------------------------------------------
TEST(OrderTypesTest, PriceAndQuantityAreNonNegative) {
  EXPECT_THROW(Price{Decimal::parse("-0.01")}, ValidationError);
  EXPECT_THROW(Quantity{Decimal(-1)}, ValidationError);
  EXPECT_TRUE(Price(Decimal(0)).isZero());
  EXPECT_TRUE(Quantity(Decimal(0)).isZero());
}

// -----------------------------------------------------------------------------
// 16. With an injected clock, timestamps and the GTD expiry check follow it
//     rather than the wall clock.
// -----------------------------------------------------------------------------
TEST(OrderClockTest, InjectedClockDrivesTimestamps) {
  tradeguard::SimulationTimeProvider clock{1'000'000};

  Order order = Order::create(makeParams(), &clock);
  EXPECT_EQ(tradeguard::timestamp_to_ms(order.createdAt()), 1'000'000);
  EXPECT_EQ(tradeguard::timestamp_to_ms(order.events().front().at), 1'000'000);

  clock.advance_by(250);
  order.confirm();
  EXPECT_EQ(tradeguard::timestamp_to_ms(order.updatedAt()), 1'000'250);
  EXPECT_EQ(tradeguard::timestamp_to_ms(order.events().back().at), 1'000'250);

  // GTD expiry is compared against the injected time, not system_clock.
  OrderParams gtd = makeParams();
  gtd.time_in_force = TimeInForce::GTD;
  gtd.expires_at = tradeguard::ms_to_timestamp(1'000'000);
  EXPECT_THROW(Order::create(gtd, &clock), ValidationError);

  gtd.expires_at = tradeguard::ms_to_timestamp(1'000'500);
  EXPECT_NO_THROW(Order::create(gtd, &clock));
}

// -----------------------------------------------------------------------------
// 17. referencePrice(): the limit price when set, the stop trigger for stop
//     orders without one, nothing for Market orders.
// -----------------------------------------------------------------------------
TEST(OrderClockTest, ReferencePriceByType) {
  Order limit = Order::create(makeParams());
  ASSERT_TRUE(limit.referencePrice().has_value());
  EXPECT_EQ(limit.referencePrice()->value(), Decimal(50000));

  OrderParams stop = makeParams();
  stop.order_type = OrderType::StopLoss;
  stop.price = Decimal(0);
  stop.stop_price = Decimal(48000);
  Order stop_loss = Order::create(stop);
  ASSERT_TRUE(stop_loss.referencePrice().has_value());
  EXPECT_EQ(stop_loss.referencePrice()->value(), Decimal(48000));

  OrderParams market = makeParams();
  market.order_type = OrderType::Market;
  market.price = Decimal(0);
  EXPECT_FALSE(Order::create(market).referencePrice().has_value());
}
