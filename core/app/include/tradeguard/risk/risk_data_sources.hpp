#pragma once

#include "tradeguard/domain/decimal.hpp"
#include "tradeguard/domain/position.hpp"
#include "tradeguard/domain/risk_limits.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// Risk collaborator interfaces
// -----------------------------------------------------------------------------
//
// @brief  Narrow synchronous queries the risk layer makes against systems it
//         does not own (configuration store, portfolio accounting, order
//         history, venue calendars, strategy registry).
//
// @details
// Failure contract shared by every interface below: an implementation that
// cannot answer throws DependencyUnavailableError. The risk checker catches
// it, logs a warning and proceeds with a fallback (default limits, or
// "allow"). Any other exception type propagates to the caller unchanged.
//
// Thread model:
//   Implementations are called concurrently from caller threads and from
//   the RiskService monitor threads, and must be thread-safe.
// -----------------------------------------------------------------------------

// Per-strategy limit configuration.
class IRiskLimitsStore {
 public:
  virtual ~IRiskLimitsStore() = default;

  // std::nullopt when no limits are configured for strategy_id.
  virtual std::optional<domain::RiskLimits> strategyLimits(
      const std::string& strategy_id) const = 0;
};

class IExposureCalculator {
 public:
  virtual ~IExposureCalculator() = default;

  // Aggregate notional of the strategy's open orders and positions.
  virtual domain::Decimal currentExposure(
      const std::string& strategy_id) const = 0;
};

class IDrawdownCalculator {
 public:
  virtual ~IDrawdownCalculator() = default;

  // Peak-to-trough decline as a percentage (12.5 = 12.5%).
  virtual domain::Decimal currentDrawdownPercent(
      const std::string& strategy_id) const = 0;
};

class IPositionLookup {
 public:
  virtual ~IPositionLookup() = default;

  // std::nullopt when the strategy holds nothing in symbol.
  virtual std::optional<domain::Position> position(
      const std::string& strategy_id, const std::string& symbol) const = 0;
};

class IOrderRateSource {
 public:
  virtual ~IOrderRateSource() = default;

  // Orders submitted by strategy_id within the trailing window.
  virtual std::int64_t recentOrderCount(
      const std::string& strategy_id,
      std::chrono::milliseconds window) const = 0;
};

class IMarketCalendar {
 public:
  virtual ~IMarketCalendar() = default;

  virtual bool isOpen(const std::string& exchange, const std::string& symbol,
                      Timestamp now) const = 0;
};

// Enumerates the strategies the background monitors should poll.
class IStrategyDirectory {
 public:
  virtual ~IStrategyDirectory() = default;

  virtual std::vector<std::string> activeStrategies() const = 0;
};

struct StrategyState {
  bool active{false};
  domain::Decimal available_capital;
};

class IStrategyStateLookup {
 public:
  virtual ~IStrategyStateLookup() = default;

  virtual StrategyState state(const std::string& strategy_id) const = 0;
};

// -----------------------------------------------------------------------------
// RiskDataSources: the checker's collaborator bundle
// -----------------------------------------------------------------------------
// Non-owning pointers. Every collaborator must outlive the RiskChecker that
// holds this bundle. A null pointer means "not configured":
//   limits_store     null → default limits for every strategy
//   exposure         null → exposure rule and checkExposure skipped
//   drawdown         null → checkDrawdown skipped
//   positions        null → position rule passes
//   order_rate       null → order-rate rule passes
//   market_calendar  null → market-hours rule passes (always-on market)
// -----------------------------------------------------------------------------
struct RiskDataSources {
  const IRiskLimitsStore* limits_store{nullptr};
  const IExposureCalculator* exposure{nullptr};
  const IDrawdownCalculator* drawdown{nullptr};
  const IPositionLookup* positions{nullptr};
  const IOrderRateSource* order_rate{nullptr};
  const IMarketCalendar* market_calendar{nullptr};
};

}  // namespace tradeguard
