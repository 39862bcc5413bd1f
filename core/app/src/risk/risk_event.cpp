#include "tradeguard/risk/risk_event.hpp"

namespace tradeguard {

const char* toString(RiskEventType type) {
  switch (type) {
    case RiskEventType::OrderValidation:    return "order_validation";
    case RiskEventType::PositionValidation: return "position_validation";
    case RiskEventType::ExposureLimit:      return "exposure_limit";
    case RiskEventType::DrawdownLimit:      return "drawdown_limit";
  }
  return "unknown";
}

const char* toString(RiskSeverity severity) {
  switch (severity) {
    case RiskSeverity::Medium:   return "medium";
    case RiskSeverity::High:     return "high";
    case RiskSeverity::Critical: return "critical";
  }
  return "unknown";
}

const char* toString(RiskAction action) {
  switch (action) {
    case RiskAction::BlockOrder:      return "block_order";
    case RiskAction::ReduceExposure:  return "reduce_exposure";
    case RiskAction::StopStrategy:    return "stop_strategy";
    case RiskAction::MonitorPosition: return "monitor_position";
  }
  return "unknown";
}

double severityWeight(RiskSeverity severity) {
  switch (severity) {
    case RiskSeverity::Medium:   return 10.0;
    case RiskSeverity::High:     return 25.0;
    case RiskSeverity::Critical: return 50.0;
  }
  return 0.0;
}

// -----------------------------------------------------------------------------
// toJson(): wire object for the EVENTS command and the PUB stream
// -----------------------------------------------------------------------------
nlohmann::json RiskEvent::toJson() const {
  nlohmann::json j;
  j["type"] = "risk_event";
  j["id"] = id;
  j["event_type"] = toString(type);
  j["severity"] = toString(severity);
  j["strategy_id"] = strategy_id;
  j["symbol"] = symbol ? nlohmann::json(*symbol) : nlohmann::json();
  j["description"] = description;
  j["data"] = data;
  j["action"] = toString(action);
  j["resolved"] = resolved;
  j["created_at"] = timestamp_to_ms(created_at);
  return j;
}

}  // namespace tradeguard
