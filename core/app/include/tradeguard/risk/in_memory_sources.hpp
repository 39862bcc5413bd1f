#pragma once

#include "tradeguard/risk/risk_data_sources.hpp"
#include "tradeguard/risk/risk_event.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// In-memory collaborators
// -----------------------------------------------------------------------------
//
// @brief  Thread-safe, process-local implementations of the risk collaborator
//         interfaces. PretradeEngine wires them when no external system is
//         attached; tests use them to stage exposure, drawdown, positions and
//         outages.
//
// @details
// Each class has a setUnavailable() switch. While it is on, every query
// throws DependencyUnavailableError, which is how the degraded paths of the
// risk checker are exercised.
//
// Thread model:
//   Readers take a shared_lock, setters a unique_lock. Safe to call from
//   any thread.
// -----------------------------------------------------------------------------

class InMemoryRiskLimitsStore final : public IRiskLimitsStore {
 public:
  std::optional<domain::RiskLimits> strategyLimits(
      const std::string& strategy_id) const override;

  void setLimits(const std::string& strategy_id,
                 const domain::RiskLimits& limits);
  void removeLimits(const std::string& strategy_id);
  void setUnavailable(bool unavailable) { unavailable_.store(unavailable); }

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, domain::RiskLimits> limits_;
  std::atomic<bool> unavailable_{false};
};

// -----------------------------------------------------------------------------
// InMemoryRiskData: portfolio state for the checker and the monitors
// -----------------------------------------------------------------------------
// Exposure and drawdown default to 0 for unknown strategies. Strategies are
// listed by activeStrategies() once added with addStrategy() or
// setStrategyState(..., active=true). state() on an unknown strategy throws
// DependencyUnavailableError.
// -----------------------------------------------------------------------------
class InMemoryRiskData final : public IExposureCalculator,
                               public IDrawdownCalculator,
                               public IPositionLookup,
                               public IStrategyDirectory,
                               public IStrategyStateLookup {
 public:
  domain::Decimal currentExposure(
      const std::string& strategy_id) const override;
  domain::Decimal currentDrawdownPercent(
      const std::string& strategy_id) const override;
  std::optional<domain::Position> position(
      const std::string& strategy_id,
      const std::string& symbol) const override;
  std::vector<std::string> activeStrategies() const override;
  StrategyState state(const std::string& strategy_id) const override;

  void setExposure(const std::string& strategy_id, domain::Decimal exposure);
  void setDrawdownPercent(const std::string& strategy_id,
                          domain::Decimal drawdown);
  void setPosition(const domain::Position& position);
  void clearPosition(const std::string& strategy_id,
                     const std::string& symbol);
  void addStrategy(const std::string& strategy_id);
  void setStrategyState(const std::string& strategy_id,
                        const StrategyState& state);

  void setExposureUnavailable(bool v) { exposure_unavailable_.store(v); }
  void setDrawdownUnavailable(bool v) { drawdown_unavailable_.store(v); }
  void setPositionsUnavailable(bool v) { positions_unavailable_.store(v); }
  void setStrategyStateUnavailable(bool v) { state_unavailable_.store(v); }

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, domain::Decimal> exposure_;
  std::map<std::string, domain::Decimal> drawdown_;
  std::map<std::pair<std::string, std::string>, domain::Position> positions_;
  std::set<std::string> strategies_;
  std::map<std::string, StrategyState> states_;

  std::atomic<bool> exposure_unavailable_{false};
  std::atomic<bool> drawdown_unavailable_{false};
  std::atomic<bool> positions_unavailable_{false};
  std::atomic<bool> state_unavailable_{false};
};

// -----------------------------------------------------------------------------
// SlidingWindowOrderRate: recent-order counter
// -----------------------------------------------------------------------------
//
// @brief  Remembers submission timestamps per strategy and counts those that
//         fall inside a trailing window ending at clock.now_ms().
//
// @details
// A timestamp t counts for window w when now - t < w. recordOrder() prunes
// entries older than the retention period, so memory stays bounded by the
// order rate. Queries for a window longer than the retention period only
// see what was retained.
//
// The clock is injected so tests drive window boundaries with a
// SimulationTimeProvider.
// -----------------------------------------------------------------------------
class SlidingWindowOrderRate final : public IOrderRateSource {
 public:
  explicit SlidingWindowOrderRate(
      const ITimeProvider& clock,
      std::chrono::milliseconds retention = std::chrono::milliseconds(1000));

  std::int64_t recentOrderCount(
      const std::string& strategy_id,
      std::chrono::milliseconds window) const override;

  // Records one submission for strategy_id at the current clock time.
  void recordOrder(const std::string& strategy_id);

  void setUnavailable(bool unavailable) { unavailable_.store(unavailable); }

 private:
  const ITimeProvider& clock_;
  const std::int64_t retention_ms_;
  mutable std::mutex mutex_;
  std::map<std::string, std::deque<std::int64_t>> submissions_;
  std::atomic<bool> unavailable_{false};
};

// -----------------------------------------------------------------------------
// InMemoryRiskEventStore: keeps every saved RiskEvent in arrival order
// -----------------------------------------------------------------------------
class InMemoryRiskEventStore final : public IRiskEventStore {
 public:
  void save(const RiskEvent& event) override;

  std::vector<RiskEvent> events() const;
  std::size_t size() const;
  void setUnavailable(bool unavailable) { unavailable_.store(unavailable); }

 private:
  mutable std::mutex mutex_;
  std::vector<RiskEvent> events_;
  std::atomic<bool> unavailable_{false};
};

}  // namespace tradeguard
