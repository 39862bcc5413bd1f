#include "tradeguard/config/engine_config.hpp"
#include "tradeguard/domain/errors.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace tradeguard {

using domain::Decimal;
using nlohmann::json;

namespace {

std::string join(const std::string& path, const std::string& key) {
  return path.empty() ? key : path + "." + key;
}

const json* member(const json& object, const std::string& key) {
  auto it = object.find(key);
  return it == object.end() ? nullptr : &*it;
}

void requireObject(const json& value, const std::string& path) {
  if (!value.is_object()) {
    throw ValidationError(path, path + " must be a JSON object");
  }
}

// -----------------------------------------------------------------------------
// Scalar readers: leave `out` untouched when the key is absent
// -----------------------------------------------------------------------------
Decimal toDecimal(const json& value, const std::string& path) {
  if (value.is_string()) {
    try {
      return Decimal::parse(value.get<std::string>());
    } catch (const std::invalid_argument& e) {
      throw ValidationError(path, path + ": " + e.what());
    } catch (const std::overflow_error& e) {
      throw ValidationError(path, path + ": " + e.what());
    }
  }
  try {
    if (value.is_number_integer()) {
      return Decimal(value.get<std::int64_t>());
    }
    if (value.is_number_float()) {
      return Decimal::fromDouble(value.get<double>());
    }
  } catch (const std::overflow_error& e) {
    throw ValidationError(path, path + ": " + e.what());
  }
  throw ValidationError(path, path + " must be a decimal string or number");
}

void readDecimal(const json& object, const std::string& key,
                 const std::string& path, Decimal& out) {
  if (const json* value = member(object, key)) {
    out = toDecimal(*value, join(path, key));
  }
}

void readInt(const json& object, const std::string& key,
             const std::string& path, std::int64_t& out) {
  if (const json* value = member(object, key)) {
    if (!value->is_number_integer()) {
      throw ValidationError(join(path, key),
                            join(path, key) + " must be an integer");
    }
    out = value->get<std::int64_t>();
  }
}

void readPositive(const json& object, const std::string& key,
                  const std::string& path, std::int64_t& out) {
  std::int64_t value = out;
  readInt(object, key, path, value);
  if (value <= 0) {
    throw ValidationError(join(path, key),
                          join(path, key) + " must be positive");
  }
  out = value;
}

void readString(const json& object, const std::string& key,
                const std::string& path, std::string& out) {
  if (const json* value = member(object, key)) {
    if (!value->is_string()) {
      throw ValidationError(join(path, key),
                            join(path, key) + " must be a string");
    }
    out = value->get<std::string>();
  }
}

// -----------------------------------------------------------------------------
// Section parsers
// -----------------------------------------------------------------------------
domain::RiskLimits parseLimits(const json& object, const std::string& path,
                               domain::RiskLimits limits) {
  requireObject(object, path);
  readDecimal(object, "max_position_size", path, limits.max_position_size);
  readDecimal(object, "max_order_size", path, limits.max_order_size);
  readDecimal(object, "max_daily_loss", path, limits.max_daily_loss);
  readDecimal(object, "max_drawdown_percent", path,
              limits.max_drawdown_percent);
  readInt(object, "max_orders_per_second", path,
          limits.max_orders_per_second);
  readDecimal(object, "max_exposure", path, limits.max_exposure);
  readDecimal(object, "stop_loss_percent", path, limits.stop_loss_percent);
  readDecimal(object, "take_profit_percent", path,
              limits.take_profit_percent);

  try {
    limits.validate();
  } catch (const ValidationError& e) {
    throw ValidationError(join(path, e.field()), e.what());
  }
  return limits;
}

RiskServiceConfig parseRiskService(const json& object,
                                   const std::string& path) {
  requireObject(object, path);
  RiskServiceConfig config;

  std::int64_t event_buffer =
      static_cast<std::int64_t>(config.event_buffer_size);
  std::int64_t violation_buffer =
      static_cast<std::int64_t>(config.violation_buffer_size);
  std::int64_t exposure_ms = config.exposure_check_interval.count();
  std::int64_t drawdown_ms = config.drawdown_check_interval.count();
  std::int64_t max_events =
      static_cast<std::int64_t>(config.max_stored_events);

  readPositive(object, "event_buffer_size", path, event_buffer);
  readPositive(object, "violation_buffer_size", path, violation_buffer);
  readPositive(object, "exposure_check_interval_ms", path, exposure_ms);
  readPositive(object, "drawdown_check_interval_ms", path, drawdown_ms);
  readPositive(object, "max_stored_events", path, max_events);

  config.event_buffer_size = static_cast<std::size_t>(event_buffer);
  config.violation_buffer_size = static_cast<std::size_t>(violation_buffer);
  config.exposure_check_interval = std::chrono::milliseconds(exposure_ms);
  config.drawdown_check_interval = std::chrono::milliseconds(drawdown_ms);
  config.max_stored_events = static_cast<std::size_t>(max_events);
  return config;
}

std::map<std::string, std::string> parseStringMap(const json& object,
                                                  const std::string& path) {
  requireObject(object, path);
  std::map<std::string, std::string> result;
  for (auto it = object.begin(); it != object.end(); ++it) {
    readString(object, it.key(), path, result[it.key()]);
  }
  return result;
}

CommissionConfig parseCommission(const json& object, const std::string& path) {
  requireObject(object, path);
  CommissionConfig config;

  readDecimal(object, "default_rate", path, config.default_rate);
  if (config.default_rate.isNegative()) {
    throw ValidationError(join(path, "default_rate"),
                          join(path, "default_rate") +
                              " must not be negative");
  }
  readString(object, "default_settlement_asset", path,
             config.default_settlement_asset);

  if (const json* rates = member(object, "exchange_rates")) {
    const std::string rates_path = join(path, "exchange_rates");
    requireObject(*rates, rates_path);
    for (auto it = rates->begin(); it != rates->end(); ++it) {
      Decimal rate = toDecimal(it.value(), join(rates_path, it.key()));
      if (rate.isNegative()) {
        throw ValidationError(join(rates_path, it.key()),
                              join(rates_path, it.key()) +
                                  " must not be negative");
      }
      config.exchange_rates[it.key()] = rate;
    }
  }
  if (const json* assets = member(object, "exchange_settlement_assets")) {
    config.exchange_settlement_assets =
        parseStringMap(*assets, join(path, "exchange_settlement_assets"));
  }
  if (const json* assets = member(object, "symbol_settlement_assets")) {
    config.symbol_settlement_assets =
        parseStringMap(*assets, join(path, "symbol_settlement_assets"));
  }
  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseEngineConfig()
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const json& root) {
  requireObject(root, "config");
  EngineConfig config;

  if (const json* limits = member(root, "default_limits")) {
    config.default_limits =
        parseLimits(*limits, "default_limits", config.default_limits);
  }

  if (const json* strategies = member(root, "strategies")) {
    requireObject(*strategies, "strategies");
    for (auto it = strategies->begin(); it != strategies->end(); ++it) {
      config.strategy_limits[it.key()] = parseLimits(
          it.value(), join("strategies", it.key()), config.default_limits);
    }
  }

  if (const json* risk = member(root, "risk_service")) {
    config.risk_service = parseRiskService(*risk, "risk_service");
  }

  if (const json* commission = member(root, "commission")) {
    config.commission = parseCommission(*commission, "commission");
  }

  if (const json* ipc = member(root, "ipc")) {
    requireObject(*ipc, "ipc");
    readString(*ipc, "command_endpoint", "ipc", config.ipc.command_endpoint);
    readString(*ipc, "publish_endpoint", "ipc", config.ipc.publish_endpoint);
  }

  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig()
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ValidationError("config", "cannot open config file " + path);
  }

  json root;
  try {
    root = json::parse(in);
  } catch (const json::parse_error& e) {
    throw ValidationError("config",
                          "invalid JSON in " + path + ": " + e.what());
  }
  return parseEngineConfig(root);
}

}  // namespace tradeguard
