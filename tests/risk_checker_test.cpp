// =============================================================================
// risk_checker_test.cpp
// =============================================================================
// Unit tests for tradeguard::RiskChecker and the in-memory collaborators it
// reads from.
//
// Validates:
//   - Each order rule in isolation (size, position, exposure, rate, market
//     hours) and the order in which they are evaluated
//   - Per-strategy limits with fallback to the defaults
//   - Degraded collaborators warn and allow instead of blocking
//   - validatePosition(): size, daily loss, maintenance margin
//   - checkExposure() / checkDrawdown() readings and violations
//   - SlidingWindowOrderRate window boundaries on a simulated clock
//   - Stop orders are valued at their trigger price for exposure
//   - Notionals outside the Decimal range fail the rule instead of escaping
//
// Design: Each test gets a fresh fixture. Orders are built with
// Order::create directly so no id generator is involved.
// =============================================================================

#include "tradeguard/domain/errors.hpp"
#include "tradeguard/domain/order.hpp"
#include "tradeguard/domain/position.hpp"
#include "tradeguard/domain/risk_limits.hpp"
#include "tradeguard/risk/in_memory_sources.hpp"
#include "tradeguard/risk/risk_checker.hpp"
#include "tradeguard/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using tradeguard::DependencyUnavailableError;
using tradeguard::RiskViolationError;
using tradeguard::RiskViolationKind;
using tradeguard::domain::Decimal;
using tradeguard::domain::Order;
using tradeguard::domain::OrderParams;
using tradeguard::domain::OrderSide;
using tradeguard::domain::OrderType;
using tradeguard::domain::Position;

// Calendar stub with a switch.
class FixedCalendar : public tradeguard::IMarketCalendar {
 public:
  explicit FixedCalendar(bool open) : open_(open) {}
  bool isOpen(const std::string&, const std::string&,
              tradeguard::Timestamp) const override {
    return open_;
  }

 private:
  bool open_;
};

class RiskCheckerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    sources.limits_store = &limits_store;
    sources.exposure = &data;
    sources.drawdown = &data;
    sources.positions = &data;
    sources.order_rate = &order_rate;
  }

  tradeguard::RiskChecker makeChecker() {
    return tradeguard::RiskChecker(sources, tradeguard::domain::defaultRiskLimits(),
                                   &clock);
  }

  static Order makeOrder(const std::string& qty, const std::string& price,
                         OrderSide side = OrderSide::Buy,
                         const std::string& strategy = "alpha") {
    OrderParams p;
    p.id = "ord-1";
    p.strategy_id = strategy;
    p.symbol = "BTC/USDT";
    p.exchange = "binance";
    p.side = side;
    p.order_type = OrderType::Limit;
    p.quantity = Decimal::parse(qty);
    p.price = Decimal::parse(price);
    return Order::create(p);
  }

  // Expects validateOrder to throw with the given kind.
  static void expectViolation(tradeguard::RiskChecker& checker,
                              const Order& order, RiskViolationKind kind) {
    try {
      checker.validateOrder(order);
      FAIL() << "expected " << tradeguard::toString(kind) << " violation";
    } catch (const RiskViolationError& e) {
      EXPECT_EQ(e.kind(), kind) << e.what();
    }
  }

  tradeguard::SimulationTimeProvider clock{1'700'000'000'000};
  tradeguard::InMemoryRiskLimitsStore limits_store;
  tradeguard::InMemoryRiskData data;
  tradeguard::SlidingWindowOrderRate order_rate{clock};
  tradeguard::RiskDataSources sources;
};

// -----------------------------------------------------------------------------
// 1. An order inside every limit passes.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, OrderWithinLimitsPasses) {
  auto checker = makeChecker();
  EXPECT_NO_THROW(checker.validateOrder(makeOrder("10", "200")));
}

// -----------------------------------------------------------------------------
// 2. quantity > max_order_size is always rejected, with the numbers attached.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, OrderSizeAboveMaximumRejected) {
  auto checker = makeChecker();
  try {
    checker.validateOrder(makeOrder("100.5", "1"));
    FAIL() << "expected OrderSize violation";
  } catch (const RiskViolationError& e) {
    EXPECT_EQ(e.kind(), RiskViolationKind::OrderSize);
    EXPECT_EQ(e.strategyId(), "alpha");
    EXPECT_EQ(e.symbol(), "BTC/USDT");
    EXPECT_EQ(e.currentValue(), Decimal::parse("100.5"));
    EXPECT_EQ(e.limitValue(), Decimal(100));
  }

  // Exactly at the limit is allowed.
  EXPECT_NO_THROW(checker.validateOrder(makeOrder("100", "1")));
}

// -----------------------------------------------------------------------------
// 3. Position rule uses the signed projected position.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, PositionLimitUsesSignedDelta) {
  Position pos;
  pos.strategy_id = "alpha";
  pos.symbol = "BTC/USDT";
  pos.net_quantity = Decimal(950);
  data.setPosition(pos);
  auto checker = makeChecker();

  // 950 + 60 = 1010 > 1000.
  expectViolation(checker, makeOrder("60", "1"), RiskViolationKind::PositionSize);

  // 950 - 60 = 890: selling reduces the position.
  EXPECT_NO_THROW(checker.validateOrder(makeOrder("60", "1", OrderSide::Sell)));

  // Short side: -950 - 60 = -1010, |.| > 1000.
  pos.net_quantity = Decimal(-950);
  data.setPosition(pos);
  expectViolation(checker, makeOrder("60", "1", OrderSide::Sell),
                  RiskViolationKind::PositionSize);
}

// -----------------------------------------------------------------------------
// 4. Without a position in the symbol the position rule passes.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, NoPositionPasses) {
  auto checker = makeChecker();
  data.clearPosition("alpha", "BTC/USDT");
  EXPECT_NO_THROW(checker.validateOrder(makeOrder("100", "1")));
}

// -----------------------------------------------------------------------------
// 5. Exposure: current + qty * price must stay within max_exposure.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, ExposureLimit) {
  auto limits = tradeguard::domain::defaultRiskLimits();
  limits.max_exposure = Decimal(50000);
  limits_store.setLimits("alpha", limits);
  data.setExposure("alpha", Decimal(49000));
  auto checker = makeChecker();

  // 49000 + 10 * 200 = 51000 > 50000.
  try {
    checker.validateOrder(makeOrder("10", "200"));
    FAIL() << "expected Exposure violation";
  } catch (const RiskViolationError& e) {
    EXPECT_EQ(e.kind(), RiskViolationKind::Exposure);
    EXPECT_EQ(e.currentValue(), Decimal(51000));
    EXPECT_EQ(e.limitValue(), Decimal(50000));
  }

  // 49000 + 5 * 200 = 50000, exactly at the limit.
  EXPECT_NO_THROW(checker.validateOrder(makeOrder("5", "200")));
}

// -----------------------------------------------------------------------------
// 6. Order rate: with max_orders_per_second orders already in the window the
//    next one is refused; the window slides with the clock.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, OrderRateLimit) {
  auto limits = tradeguard::domain::defaultRiskLimits();
  limits.max_orders_per_second = 3;
  limits_store.setLimits("alpha", limits);
  auto checker = makeChecker();

  for (int i = 0; i < 3; ++i) {
    ASSERT_NO_THROW(checker.validateOrder(makeOrder("1", "1")));
    order_rate.recordOrder("alpha");
    clock.advance_by(100);
  }
  expectViolation(checker, makeOrder("1", "1"), RiskViolationKind::OrderRate);

  // First submission was at t0; at t0 + 1000 it has left the window.
  clock.advance_by(700);
  EXPECT_EQ(order_rate.recentOrderCount("alpha", std::chrono::milliseconds(1000)),
            2);
  EXPECT_NO_THROW(checker.validateOrder(makeOrder("1", "1")));

  // Other strategies are counted separately.
  EXPECT_NO_THROW(
      checker.validateOrder(makeOrder("1", "1", OrderSide::Buy, "beta")));
}

// -----------------------------------------------------------------------------
// 7. Market hours are only checked when a calendar is configured.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, MarketHoursWithCalendar) {
  FixedCalendar closed(false);
  FixedCalendar open(true);

  auto unchecked = makeChecker();
  EXPECT_NO_THROW(unchecked.validateOrder(makeOrder("1", "1")));

  sources.market_calendar = &closed;
  auto closed_checker = makeChecker();
  expectViolation(closed_checker, makeOrder("1", "1"),
                  RiskViolationKind::MarketClosed);

  sources.market_calendar = &open;
  auto open_checker = makeChecker();
  EXPECT_NO_THROW(open_checker.validateOrder(makeOrder("1", "1")));
}

// -----------------------------------------------------------------------------
// 8. Rules run in a fixed order: size is reported before exposure.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, FirstFailingRuleWins) {
  data.setExposure("alpha", Decimal(99999));
  auto checker = makeChecker();
  expectViolation(checker, makeOrder("150", "1000"),
                  RiskViolationKind::OrderSize);
}

// -----------------------------------------------------------------------------
// 9. Stored limits override the defaults; unknown strategies and an
//    unavailable store fall back to the defaults.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, LimitsFallBackToDefaults) {
  auto tight = tradeguard::domain::defaultRiskLimits();
  tight.max_order_size = Decimal(5);
  limits_store.setLimits("alpha", tight);
  auto checker = makeChecker();

  EXPECT_EQ(checker.limitsFor("alpha").max_order_size, Decimal(5));
  EXPECT_EQ(checker.limitsFor("unknown").max_order_size, Decimal(100));
  expectViolation(checker, makeOrder("10", "1"), RiskViolationKind::OrderSize);

  limits_store.setUnavailable(true);
  EXPECT_EQ(checker.limitsFor("alpha").max_order_size, Decimal(100));
  EXPECT_NO_THROW(checker.validateOrder(makeOrder("10", "1")));
}

// -----------------------------------------------------------------------------
// 10. Unavailable exposure, position and rate sources never block an order.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, DegradedCollaboratorsAllowOrder) {
  auto limits = tradeguard::domain::defaultRiskLimits();
  limits.max_exposure = Decimal(10);
  limits.max_orders_per_second = 0;
  limits_store.setLimits("alpha", limits);
  data.setExposureUnavailable(true);
  data.setPositionsUnavailable(true);
  order_rate.setUnavailable(true);
  auto checker = makeChecker();

  EXPECT_NO_THROW(checker.validateOrder(makeOrder("1", "1000")));
}

// -----------------------------------------------------------------------------
// 11. Negative default limits are refused at construction.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, InvalidDefaultsRejected) {
  auto bad = tradeguard::domain::defaultRiskLimits();
  bad.max_exposure = Decimal(-1);
  EXPECT_THROW(tradeguard::RiskChecker(sources, bad, &clock),
               tradeguard::ValidationError);
  EXPECT_THROW(limits_store.setLimits("alpha", bad),
               tradeguard::ValidationError);
}

// -----------------------------------------------------------------------------
// 12. validatePosition(): size, then open loss, then maintenance margin.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, ValidatePositionRules) {
  auto checker = makeChecker();

  Position pos;
  pos.strategy_id = "alpha";
  pos.symbol = "ETH/USDT";
  pos.net_quantity = Decimal(-10);
  pos.unrealized_pnl = Decimal(-500);
  pos.margin = Decimal(2000);
  pos.maintenance_margin = Decimal(1000);
  EXPECT_NO_THROW(checker.validatePosition(pos));

  Position big = pos;
  big.net_quantity = Decimal(-1001);
  try {
    checker.validatePosition(big);
    FAIL() << "expected PositionSize violation";
  } catch (const RiskViolationError& e) {
    EXPECT_EQ(e.kind(), RiskViolationKind::PositionSize);
    EXPECT_EQ(e.currentValue(), Decimal(1001));
  }

  Position losing = pos;
  losing.unrealized_pnl = Decimal(-10001);
  try {
    checker.validatePosition(losing);
    FAIL() << "expected DailyLoss violation";
  } catch (const RiskViolationError& e) {
    EXPECT_EQ(e.kind(), RiskViolationKind::DailyLoss);
  }

  Position thin = pos;
  thin.margin = Decimal(999);
  try {
    checker.validatePosition(thin);
    FAIL() << "expected Margin violation";
  } catch (const RiskViolationError& e) {
    EXPECT_EQ(e.kind(), RiskViolationKind::Margin);
  }

  // No maintenance requirement, no margin rule.
  Position unmargined = pos;
  unmargined.margin = Decimal(0);
  unmargined.maintenance_margin = Decimal(0);
  EXPECT_NO_THROW(checker.validatePosition(unmargined));
}

// -----------------------------------------------------------------------------
// 13. checkExposure() / checkDrawdown() return readings within limits and
//     throw above them.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, ExposureAndDrawdownReadings) {
  auto checker = makeChecker();
  data.setExposure("alpha", Decimal(42000));
  data.setDrawdownPercent("alpha", Decimal::parse("12.5"));

  auto exposure = checker.checkExposure("alpha");
  ASSERT_TRUE(exposure.has_value());
  EXPECT_EQ(exposure->value, Decimal(42000));
  EXPECT_EQ(exposure->limit, Decimal(100000));

  auto drawdown = checker.checkDrawdown("alpha");
  ASSERT_TRUE(drawdown.has_value());
  EXPECT_EQ(drawdown->value, Decimal::parse("12.5"));

  data.setExposure("alpha", Decimal(100001));
  data.setDrawdownPercent("alpha", Decimal::parse("20.01"));
  try {
    checker.checkExposure("alpha");
    FAIL() << "expected Exposure violation";
  } catch (const RiskViolationError& e) {
    EXPECT_EQ(e.kind(), RiskViolationKind::Exposure);
  }
  try {
    checker.checkDrawdown("alpha");
    FAIL() << "expected Drawdown violation";
  } catch (const RiskViolationError& e) {
    EXPECT_EQ(e.kind(), RiskViolationKind::Drawdown);
    EXPECT_EQ(e.limitValue(), Decimal(20));
  }
}

// -----------------------------------------------------------------------------
// 14. Unavailable or unconfigured calculators yield no reading.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, UnavailableCalculatorsYieldNoReading) {
  auto checker = makeChecker();
  data.setExposureUnavailable(true);
  data.setDrawdownUnavailable(true);
  EXPECT_FALSE(checker.checkExposure("alpha").has_value());
  EXPECT_FALSE(checker.checkDrawdown("alpha").has_value());

  tradeguard::RiskChecker bare(tradeguard::RiskDataSources{},
                               tradeguard::domain::defaultRiskLimits());
  EXPECT_FALSE(bare.checkExposure("alpha").has_value());
  EXPECT_NO_THROW(bare.validateOrder(makeOrder("100", "1000000")));
}

// -----------------------------------------------------------------------------
// 15. In-memory strategy state: unknown strategies are unavailable; activity
//     drives the directory.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, StrategyStateAndDirectory) {
  EXPECT_THROW(data.state("alpha"), DependencyUnavailableError);

  data.setStrategyState("alpha", tradeguard::StrategyState{true, Decimal(500)});
  data.setStrategyState("beta", tradeguard::StrategyState{false, Decimal(0)});

  EXPECT_TRUE(data.state("alpha").active);
  EXPECT_EQ(data.activeStrategies(), std::vector<std::string>{"alpha"});
}

// -----------------------------------------------------------------------------
// 16. A stop order without a limit price is valued at its stop price, so it
//     cannot bypass the exposure limit.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, StopOrderExposureUsesStopPrice) {
  auto limits = tradeguard::domain::defaultRiskLimits();
  limits.max_exposure = Decimal(50000);
  limits_store.setLimits("alpha", limits);
  data.setExposure("alpha", Decimal(49000));
  auto checker = makeChecker();

  auto stopLoss = [](const std::string& qty) {
    OrderParams p;
    p.id = "ord-stop";
    p.strategy_id = "alpha";
    p.symbol = "BTC/USDT";
    p.exchange = "binance";
    p.order_type = OrderType::StopLoss;
    p.quantity = Decimal::parse(qty);
    p.price = Decimal(0);
    p.stop_price = Decimal(200);
    return Order::create(p);
  };

  // 49000 + 10 * 200 = 51000 > 50000.
  try {
    checker.validateOrder(stopLoss("10"));
    FAIL() << "expected Exposure violation";
  } catch (const RiskViolationError& e) {
    EXPECT_EQ(e.kind(), RiskViolationKind::Exposure);
    EXPECT_EQ(e.currentValue(), Decimal(51000));
    EXPECT_EQ(e.limitValue(), Decimal(50000));
  }

  // 49000 + 5 * 200 = 50000, exactly at the limit.
  EXPECT_NO_THROW(checker.validateOrder(stopLoss("5")));
}

// -----------------------------------------------------------------------------
// 17. A notional too large for Decimal is reported as an exposure violation
//     at the largest representable value.
// -----------------------------------------------------------------------------
TEST_F(RiskCheckerTest, NotionalOverflowIsExposureViolation) {
  auto limits = tradeguard::domain::defaultRiskLimits();
  limits.max_order_size = Decimal(10'000'000);
  limits.max_position_size = Decimal(10'000'000);
  limits.max_exposure = Decimal(1'000'000'000);
  limits_store.setLimits("alpha", limits);
  data.setExposure("alpha", Decimal(0));
  auto checker = makeChecker();

  // 1e6 * 1e5 = 1e11, beyond the ~9.2e10 Decimal range.
  try {
    checker.validateOrder(makeOrder("1000000", "100000"));
    FAIL() << "expected Exposure violation";
  } catch (const RiskViolationError& e) {
    EXPECT_EQ(e.kind(), RiskViolationKind::Exposure);
    EXPECT_EQ(e.currentValue(), Decimal::max());
    EXPECT_EQ(e.limitValue(), Decimal(1'000'000'000));
  }
}
