#include "tradeguard/risk/risk_checker.hpp"
#include "tradeguard/domain/errors.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tradeguard {

using domain::Decimal;

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RiskChecker::RiskChecker(RiskDataSources sources,
                         domain::RiskLimits default_limits,
                         const ITimeProvider* clock)
    : sources_(sources),
      default_limits_(std::move(default_limits)),
      clock_(clock) {
  default_limits_.validate();
}

// -----------------------------------------------------------------------------
// validateOrder(): order rules, first failure wins
// -----------------------------------------------------------------------------
void RiskChecker::validateOrder(const domain::Order& order) {
  const domain::RiskLimits limits = limitsFor(order.strategyId());

  checkOrderSize(order, limits);
  checkPositionLimit(order, limits);
  checkExposureLimit(order, limits);
  checkOrderRate(order, limits);
  checkMarketHours(order);
}

// -----------------------------------------------------------------------------
// validatePosition()
// -----------------------------------------------------------------------------
void RiskChecker::validatePosition(const domain::Position& position) const {
  const domain::RiskLimits limits = limitsFor(position.strategy_id);

  const Decimal size = position.size();
  if (size > limits.max_position_size) {
    throw RiskViolationError(
        RiskViolationKind::PositionSize, position.strategy_id, position.symbol,
        size, limits.max_position_size,
        "position size " + size.toString() + " in " + position.symbol +
            " exceeds maximum " + limits.max_position_size.toString());
  }

  if (position.unrealized_pnl.isNegative()) {
    const Decimal loss = position.unrealized_pnl.abs();
    if (loss > limits.max_daily_loss) {
      throw RiskViolationError(
          RiskViolationKind::DailyLoss, position.strategy_id, position.symbol,
          loss, limits.max_daily_loss,
          "unrealized loss " + loss.toString() + " in " + position.symbol +
              " exceeds maximum daily loss " +
              limits.max_daily_loss.toString());
    }
  }

  if (position.maintenance_margin.isPositive() &&
      position.margin < position.maintenance_margin) {
    throw RiskViolationError(
        RiskViolationKind::Margin, position.strategy_id, position.symbol,
        position.margin, position.maintenance_margin,
        "margin " + position.margin.toString() + " in " + position.symbol +
            " is below maintenance margin " +
            position.maintenance_margin.toString());
  }
}

// -----------------------------------------------------------------------------
// checkExposure()
// -----------------------------------------------------------------------------
std::optional<RiskReading> RiskChecker::checkExposure(
    const std::string& strategy_id) const {
  if (sources_.exposure == nullptr) {
    return std::nullopt;
  }

  const domain::RiskLimits limits = limitsFor(strategy_id);

  Decimal exposure;
  try {
    exposure = sources_.exposure->currentExposure(strategy_id);
  } catch (const DependencyUnavailableError& e) {
    std::cerr << "[RiskChecker] WARNING: exposure check skipped for "
              << strategy_id << ": " << e.what() << "\n";
    return std::nullopt;
  }

  if (exposure > limits.max_exposure) {
    throw RiskViolationError(
        RiskViolationKind::Exposure, strategy_id, "", exposure,
        limits.max_exposure,
        "exposure " + exposure.toString() + " exceeds maximum " +
            limits.max_exposure.toString() + " for strategy " + strategy_id);
  }
  return RiskReading{exposure, limits.max_exposure};
}

// -----------------------------------------------------------------------------
// checkDrawdown()
// -----------------------------------------------------------------------------
std::optional<RiskReading> RiskChecker::checkDrawdown(
    const std::string& strategy_id) const {
  if (sources_.drawdown == nullptr) {
    return std::nullopt;
  }

  const domain::RiskLimits limits = limitsFor(strategy_id);

  Decimal drawdown;
  try {
    drawdown = sources_.drawdown->currentDrawdownPercent(strategy_id);
  } catch (const DependencyUnavailableError& e) {
    std::cerr << "[RiskChecker] WARNING: drawdown check skipped for "
              << strategy_id << ": " << e.what() << "\n";
    return std::nullopt;
  }

  if (drawdown > limits.max_drawdown_percent) {
    throw RiskViolationError(
        RiskViolationKind::Drawdown, strategy_id, "", drawdown,
        limits.max_drawdown_percent,
        "drawdown " + drawdown.toString() + "% exceeds maximum " +
            limits.max_drawdown_percent.toString() + "% for strategy " +
            strategy_id);
  }
  return RiskReading{drawdown, limits.max_drawdown_percent};
}

// -----------------------------------------------------------------------------
// limitsFor(): stored limits, falling back to the defaults
// -----------------------------------------------------------------------------
domain::RiskLimits RiskChecker::limitsFor(const std::string& strategy_id) const {
  if (sources_.limits_store == nullptr) {
    return default_limits_;
  }

  try {
    std::optional<domain::RiskLimits> stored =
        sources_.limits_store->strategyLimits(strategy_id);
    if (stored) {
      return *stored;
    }
  } catch (const DependencyUnavailableError& e) {
    std::cerr << "[RiskChecker] WARNING: using default limits for "
              << strategy_id << ": " << e.what() << "\n";
  }
  return default_limits_;
}

// -----------------------------------------------------------------------------
// Rule 1: order size
// -----------------------------------------------------------------------------
void RiskChecker::checkOrderSize(const domain::Order& order,
                                 const domain::RiskLimits& limits) const {
  const Decimal qty = order.quantity().value();
  if (qty > limits.max_order_size) {
    throw RiskViolationError(
        RiskViolationKind::OrderSize, order.strategyId(), order.symbol(), qty,
        limits.max_order_size,
        "order size " + qty.toString() + " exceeds maximum " +
            limits.max_order_size.toString());
  }
}

// -----------------------------------------------------------------------------
// Rule 2: position limit
// -----------------------------------------------------------------------------
void RiskChecker::checkPositionLimit(const domain::Order& order,
                                     const domain::RiskLimits& limits) const {
  if (sources_.positions == nullptr) {
    return;
  }

  std::optional<domain::Position> current;
  try {
    current = sources_.positions->position(order.strategyId(), order.symbol());
  } catch (const DependencyUnavailableError& e) {
    std::cerr << "[RiskChecker] WARNING: position check skipped for "
              << order.id() << ": " << e.what() << "\n";
    return;
  }

  if (!current) {
    return;
  }

  Decimal projected;
  try {
    const Decimal delta = domain::sign(order.side()) == 1
                              ? order.quantity().value()
                              : -order.quantity().value();
    projected = (current->net_quantity + delta).abs();
  } catch (const std::overflow_error&) {
    projected = Decimal::max();
  }
  if (projected > limits.max_position_size) {
    throw RiskViolationError(
        RiskViolationKind::PositionSize, order.strategyId(), order.symbol(),
        projected, limits.max_position_size,
        "position size " + projected.toString() + " in " + order.symbol() +
            " would exceed maximum " + limits.max_position_size.toString());
  }
}

// -----------------------------------------------------------------------------
// Rule 3: exposure limit
// -----------------------------------------------------------------------------
void RiskChecker::checkExposureLimit(const domain::Order& order,
                                     const domain::RiskLimits& limits) const {
  if (sources_.exposure == nullptr) {
    return;
  }

  Decimal current;
  try {
    current = sources_.exposure->currentExposure(order.strategyId());
  } catch (const DependencyUnavailableError& e) {
    std::cerr << "[RiskChecker] WARNING: exposure check skipped for "
              << order.id() << ": " << e.what() << "\n";
    return;
  }

  // Market orders add nothing until they execute. Stop orders without a
  // limit price are valued at their trigger.
  const std::optional<domain::Price> reference = order.referencePrice();

  // A notional outside the Decimal range is treated as the largest value,
  // which exceeds every limit.
  Decimal projected;
  try {
    projected = reference ? current + order.quantity().value() *
                                          reference->value()
                          : current;
  } catch (const std::overflow_error&) {
    projected = Decimal::max();
  }
  if (projected > limits.max_exposure) {
    throw RiskViolationError(
        RiskViolationKind::Exposure, order.strategyId(), order.symbol(),
        projected, limits.max_exposure,
        "exposure " + projected.toString() + " would exceed maximum " +
            limits.max_exposure.toString() + " for strategy " +
            order.strategyId());
  }
}

// -----------------------------------------------------------------------------
// Rule 4: order rate
// -----------------------------------------------------------------------------
void RiskChecker::checkOrderRate(const domain::Order& order,
                                 const domain::RiskLimits& limits) const {
  if (sources_.order_rate == nullptr) {
    return;
  }

  std::int64_t recent = 0;
  try {
    recent = sources_.order_rate->recentOrderCount(order.strategyId(),
                                                   kOrderRateWindow);
  } catch (const DependencyUnavailableError& e) {
    std::cerr << "[RiskChecker] WARNING: order rate check skipped for "
              << order.id() << ": " << e.what() << "\n";
    return;
  }

  if (recent >= limits.max_orders_per_second) {
    throw RiskViolationError(
        RiskViolationKind::OrderRate, order.strategyId(), order.symbol(),
        Decimal(recent), Decimal(limits.max_orders_per_second),
        "order rate " + std::to_string(recent) +
            " orders/s reached maximum " +
            std::to_string(limits.max_orders_per_second));
  }
}

// -----------------------------------------------------------------------------
// Rule 5: market hours
// -----------------------------------------------------------------------------
void RiskChecker::checkMarketHours(const domain::Order& order) const {
  if (sources_.market_calendar == nullptr) {
    return;
  }

  if (!sources_.market_calendar->isOpen(order.exchange(), order.symbol(),
                                        now())) {
    throw RiskViolationError(
        RiskViolationKind::MarketClosed, order.strategyId(), order.symbol(),
        Decimal(), Decimal(),
        "market for " + order.symbol() + " on " + order.exchange() +
            " is closed");
  }
}

Timestamp RiskChecker::now() const {
  return clock_ != nullptr ? clock_->now() : std::chrono::system_clock::now();
}

}  // namespace tradeguard
