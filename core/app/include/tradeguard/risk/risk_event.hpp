#pragma once

#include "tradeguard/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// RiskEventType / RiskSeverity / RiskAction
// -----------------------------------------------------------------------------
//
// @details
// The action is the side effect the event-processing loop performs once it
// dequeues the event. It is a closed set: every handler switch over it is
// exhaustive, so adding a value fails compilation until it is handled.
//
//   BlockOrder      order already refused synchronously, nothing to do
//   ReduceExposure  warning signal for a position-reduction collaborator
//   StopStrategy    error signal for a strategy-kill collaborator
//   MonitorPosition informational, keep watching
// -----------------------------------------------------------------------------
enum class RiskEventType {
  OrderValidation,
  PositionValidation,
  ExposureLimit,
  DrawdownLimit,
};

enum class RiskSeverity {
  Medium,
  High,
  Critical,
};

enum class RiskAction {
  BlockOrder,
  ReduceExposure,
  StopStrategy,
  MonitorPosition,
};

const char* toString(RiskEventType type);
const char* toString(RiskSeverity severity);
const char* toString(RiskAction action);

// Contribution of one event to the running risk score.
double severityWeight(RiskSeverity severity);

// -----------------------------------------------------------------------------
// RiskEvent: one recorded rule violation
// -----------------------------------------------------------------------------
//
// @brief  Created by RiskService for every failed check, stored in its event
//         map, pushed to the event channel and (for High / Critical) to the
//         violation channel.
//
// @details
// data carries the numbers behind the violation ("kind", "current_value",
// "limit_value", plus order or position fields) as a JSON object.
//
// Thread model:
//   Value type. Copies travel through the channels; the authoritative copy
//   lives in RiskService's event map, where only `resolved` ever changes.
// -----------------------------------------------------------------------------
struct RiskEvent {
  std::string id;
  RiskEventType type{RiskEventType::OrderValidation};
  RiskSeverity severity{RiskSeverity::Medium};
  std::string strategy_id;
  std::optional<std::string> symbol;
  std::string description;
  nlohmann::json data = nlohmann::json::object();
  RiskAction action{RiskAction::BlockOrder};
  bool resolved{false};
  Timestamp created_at{};

  // High and Critical events are escalated on the violation channel.
  bool isEscalation() const { return severity != RiskSeverity::Medium; }

  nlohmann::json toJson() const;
};

// -----------------------------------------------------------------------------
// IRiskEventStore: persistence sink for the event-processing loop
// -----------------------------------------------------------------------------
// save() is called on the RiskService event thread, never under the service
// lock. A throw is logged and the event is still handled.
// -----------------------------------------------------------------------------
class IRiskEventStore {
 public:
  virtual ~IRiskEventStore() = default;

  virtual void save(const RiskEvent& event) = 0;
};

}  // namespace tradeguard
