#include "tradeguard/risk/in_memory_sources.hpp"
#include "tradeguard/domain/errors.hpp"

namespace tradeguard {

// -----------------------------------------------------------------------------
// InMemoryRiskLimitsStore
// -----------------------------------------------------------------------------
std::optional<domain::RiskLimits> InMemoryRiskLimitsStore::strategyLimits(
    const std::string& strategy_id) const {
  if (unavailable_.load()) {
    throw DependencyUnavailableError("risk limits store",
                                     "store is offline");
  }
  std::shared_lock lock(mutex_);
  auto it = limits_.find(strategy_id);
  if (it == limits_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryRiskLimitsStore::setLimits(const std::string& strategy_id,
                                        const domain::RiskLimits& limits) {
  limits.validate();
  std::unique_lock lock(mutex_);
  limits_[strategy_id] = limits;
}

void InMemoryRiskLimitsStore::removeLimits(const std::string& strategy_id) {
  std::unique_lock lock(mutex_);
  limits_.erase(strategy_id);
}

// -----------------------------------------------------------------------------
// InMemoryRiskData: queries
// -----------------------------------------------------------------------------
domain::Decimal InMemoryRiskData::currentExposure(
    const std::string& strategy_id) const {
  if (exposure_unavailable_.load()) {
    throw DependencyUnavailableError("exposure calculator",
                                     "no exposure data for " + strategy_id);
  }
  std::shared_lock lock(mutex_);
  auto it = exposure_.find(strategy_id);
  return it != exposure_.end() ? it->second : domain::Decimal();
}

domain::Decimal InMemoryRiskData::currentDrawdownPercent(
    const std::string& strategy_id) const {
  if (drawdown_unavailable_.load()) {
    throw DependencyUnavailableError("drawdown calculator",
                                     "no drawdown data for " + strategy_id);
  }
  std::shared_lock lock(mutex_);
  auto it = drawdown_.find(strategy_id);
  return it != drawdown_.end() ? it->second : domain::Decimal();
}

std::optional<domain::Position> InMemoryRiskData::position(
    const std::string& strategy_id, const std::string& symbol) const {
  if (positions_unavailable_.load()) {
    throw DependencyUnavailableError("position lookup",
                                     "positions are not loaded");
  }
  std::shared_lock lock(mutex_);
  auto it = positions_.find({strategy_id, symbol});
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> InMemoryRiskData::activeStrategies() const {
  std::shared_lock lock(mutex_);
  return std::vector<std::string>(strategies_.begin(), strategies_.end());
}

StrategyState InMemoryRiskData::state(const std::string& strategy_id) const {
  if (state_unavailable_.load()) {
    throw DependencyUnavailableError("strategy state",
                                     "strategy registry is offline");
  }
  std::shared_lock lock(mutex_);
  auto it = states_.find(strategy_id);
  if (it == states_.end()) {
    throw DependencyUnavailableError("strategy state",
                                     "unknown strategy " + strategy_id);
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// InMemoryRiskData: setters
// -----------------------------------------------------------------------------
void InMemoryRiskData::setExposure(const std::string& strategy_id,
                                   domain::Decimal exposure) {
  std::unique_lock lock(mutex_);
  exposure_[strategy_id] = exposure;
}

void InMemoryRiskData::setDrawdownPercent(const std::string& strategy_id,
                                          domain::Decimal drawdown) {
  std::unique_lock lock(mutex_);
  drawdown_[strategy_id] = drawdown;
}

void InMemoryRiskData::setPosition(const domain::Position& position) {
  std::unique_lock lock(mutex_);
  positions_[{position.strategy_id, position.symbol}] = position;
}

void InMemoryRiskData::clearPosition(const std::string& strategy_id,
                                     const std::string& symbol) {
  std::unique_lock lock(mutex_);
  positions_.erase({strategy_id, symbol});
}

void InMemoryRiskData::addStrategy(const std::string& strategy_id) {
  std::unique_lock lock(mutex_);
  strategies_.insert(strategy_id);
}

void InMemoryRiskData::setStrategyState(const std::string& strategy_id,
                                        const StrategyState& state) {
  std::unique_lock lock(mutex_);
  states_[strategy_id] = state;
  if (state.active) {
    strategies_.insert(strategy_id);
  } else {
    strategies_.erase(strategy_id);
  }
}

// -----------------------------------------------------------------------------
// SlidingWindowOrderRate
// -----------------------------------------------------------------------------
SlidingWindowOrderRate::SlidingWindowOrderRate(
    const ITimeProvider& clock, std::chrono::milliseconds retention)
    : clock_(clock), retention_ms_(retention.count()) {}

std::int64_t SlidingWindowOrderRate::recentOrderCount(
    const std::string& strategy_id, std::chrono::milliseconds window) const {
  if (unavailable_.load()) {
    throw DependencyUnavailableError("order rate source",
                                     "order history is offline");
  }
  const std::int64_t now = clock_.now_ms();
  std::lock_guard lock(mutex_);
  auto it = submissions_.find(strategy_id);
  if (it == submissions_.end()) {
    return 0;
  }
  std::int64_t count = 0;
  for (std::int64_t t : it->second) {
    if (now - t < window.count()) {
      ++count;
    }
  }
  return count;
}

void SlidingWindowOrderRate::recordOrder(const std::string& strategy_id) {
  const std::int64_t now = clock_.now_ms();
  std::lock_guard lock(mutex_);
  auto& history = submissions_[strategy_id];
  history.push_back(now);
  while (!history.empty() && now - history.front() >= retention_ms_) {
    history.pop_front();
  }
}

// -----------------------------------------------------------------------------
// InMemoryRiskEventStore
// -----------------------------------------------------------------------------
void InMemoryRiskEventStore::save(const RiskEvent& event) {
  if (unavailable_.load()) {
    throw DependencyUnavailableError("risk event store",
                                     "cannot persist " + event.id);
  }
  std::lock_guard lock(mutex_);
  events_.push_back(event);
}

std::vector<RiskEvent> InMemoryRiskEventStore::events() const {
  std::lock_guard lock(mutex_);
  return events_;
}

std::size_t InMemoryRiskEventStore::size() const {
  std::lock_guard lock(mutex_);
  return events_.size();
}

}  // namespace tradeguard
