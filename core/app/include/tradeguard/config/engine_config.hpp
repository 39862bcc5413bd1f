#pragma once

#include "tradeguard/domain/risk_limits.hpp"
#include "tradeguard/order/order_service.hpp"
#include "tradeguard/risk/risk_service.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// IpcConfig
// -----------------------------------------------------------------------------
// Empty endpoints disable the IPC server.
// -----------------------------------------------------------------------------
struct IpcConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string publish_endpoint{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// EngineConfig: everything PretradeEngine needs to wire itself
// -----------------------------------------------------------------------------
//
// @details
// JSON layout (every section and key optional, missing keys keep the
// defaults below):
//
//   {
//     "default_limits": { "max_position_size": "1000", ... },
//     "strategies": {
//       "alpha": { "max_exposure": "50000", ... }
//     },
//     "risk_service": {
//       "event_buffer_size": 1000,
//       "violation_buffer_size": 100,
//       "exposure_check_interval_ms": 5000,
//       "drawdown_check_interval_ms": 10000,
//       "max_stored_events": 10000
//     },
//     "commission": {
//       "default_rate": "0.001",
//       "default_settlement_asset": "USDT",
//       "exchange_rates": { "binance": "0.00075" },
//       "exchange_settlement_assets": { "kraken": "USD" },
//       "symbol_settlement_assets": { "BTCUSDT": "BNB" }
//     },
//     "ipc": {
//       "command_endpoint": "tcp://127.0.0.1:5556",
//       "publish_endpoint": "tcp://127.0.0.1:5557"
//     }
//   }
//
// Limit keys: max_position_size, max_order_size, max_daily_loss,
// max_drawdown_percent, max_orders_per_second, max_exposure,
// stop_loss_percent, take_profit_percent.
//
// Decimal values accept either a JSON string ("0.001", exact) or a JSON
// number. Per-strategy limits start from the parsed default_limits and
// override only the keys they name.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::RiskLimits default_limits = domain::defaultRiskLimits();
  std::map<std::string, domain::RiskLimits> strategy_limits;
  RiskServiceConfig risk_service;
  CommissionConfig commission;
  IpcConfig ipc;
};

// -----------------------------------------------------------------------------
// parseEngineConfig(root)
// -----------------------------------------------------------------------------
// @throws ValidationError naming the offending key path (for example
//         "strategies.alpha.max_exposure") on a wrong type, an unparsable
//         decimal, or a negative limit.
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& root);

// -----------------------------------------------------------------------------
// loadEngineConfig(path)
// -----------------------------------------------------------------------------
// @throws ValidationError if the file cannot be opened, is not valid JSON,
//         or fails parseEngineConfig().
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace tradeguard
