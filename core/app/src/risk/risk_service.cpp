#include "tradeguard/risk/risk_service.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <set>
#include <utility>

namespace tradeguard {

namespace {

constexpr double kScoreDecay = 0.9;
constexpr double kMaxScore = 100.0;

nlohmann::json violationData(const RiskViolationError& e) {
  return nlohmann::json{{"kind", toString(e.kind())},
                        {"current_value", e.currentValue().toString()},
                        {"limit_value", e.limitValue().toString()}};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
RiskService::RiskService(RiskChecker& checker, RiskServiceConfig config,
                         IRiskEventStore* store,
                         const IStrategyDirectory* directory)
    : checker_(checker),
      config_(config),
      store_(store),
      directory_(directory),
      event_channel_(config.event_buffer_size),
      violation_channel_(config.violation_buffer_size) {
  if (config_.event_buffer_size == 0) {
    throw ValidationError("event_buffer_size",
                          "event_buffer_size must be at least 1");
  }
  if (config_.violation_buffer_size == 0) {
    throw ValidationError("violation_buffer_size",
                          "violation_buffer_size must be at least 1");
  }
  if (config_.exposure_check_interval.count() <= 0) {
    throw ValidationError("exposure_check_interval_ms",
                          "exposure_check_interval_ms must be positive");
  }
  if (config_.drawdown_check_interval.count() <= 0) {
    throw ValidationError("drawdown_check_interval_ms",
                          "drawdown_check_interval_ms must be positive");
  }
  if (config_.max_stored_events == 0) {
    throw ValidationError("max_stored_events",
                          "max_stored_events must be at least 1");
  }
}

RiskService::~RiskService() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn the three background threads
// -----------------------------------------------------------------------------
void RiskService::start(CancellationToken cancel) {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (event_thread_.joinable()) {
    return;
  }

  {
    std::lock_guard lock(stop_mutex_);
    stopping_.store(false);
  }

  event_thread_ = std::thread([this] { runEventLoop(); });
  exposure_thread_ = std::thread([this] {
    runMonitor("exposure", config_.exposure_check_interval,
               [this](const std::string& id) { checkExposure(id); });
  });
  drawdown_thread_ = std::thread([this] {
    runMonitor("drawdown", config_.drawdown_check_interval,
               [this](const std::string& id) { checkDrawdown(id); });
  });
  running_.store(true);

  cancel_token_ = std::move(cancel);
  cancel_registration_ =
      cancel_token_.registerCallback([this] { requestStop(); });

  std::cout << "[RiskService] started. Threads: events, exposure ("
            << config_.exposure_check_interval.count() << " ms), drawdown ("
            << config_.drawdown_check_interval.count() << " ms).\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void RiskService::stop() {
  std::lock_guard lifecycle(lifecycle_mutex_);

  // After this returns the cancellation callback can no longer run.
  cancel_token_.unregisterCallback(cancel_registration_);
  cancel_registration_ = 0;
  cancel_token_ = CancellationToken();

  if (!event_thread_.joinable()) {
    return;
  }

  requestStop();

  event_thread_.join();
  exposure_thread_.join();
  drawdown_thread_.join();
  running_.store(false);

  std::cout << "[RiskService] stopped. All threads joined.\n";
}

bool RiskService::isRunning() const {
  return running_.load() && !stopping_.load();
}

void RiskService::requestStop() {
  {
    std::lock_guard lock(stop_mutex_);
    stopping_.store(true);
  }
  stop_cv_.notify_all();
  event_channel_.wakeAll();
}

// -----------------------------------------------------------------------------
// validateOrder()
// -----------------------------------------------------------------------------
void RiskService::validateOrder(const domain::Order& order) {
  recordCheck();
  try {
    checker_.validateOrder(order);
  } catch (const RiskViolationError& e) {
    recordViolation(true);

    const bool exposure = e.kind() == RiskViolationKind::Exposure;
    nlohmann::json data = violationData(e);
    data["order_id"] = order.id();
    data["side"] = domain::toString(order.side());
    data["quantity"] = order.quantity().value().toString();
    data["price"] = order.price().value().toString();

    emitRiskEvent(buildEvent(
        e,
        exposure ? RiskEventType::ExposureLimit
                 : RiskEventType::OrderValidation,
        exposure ? RiskSeverity::High : RiskSeverity::Medium,
        RiskAction::BlockOrder, std::move(data)));
    throw;
  }
}

// -----------------------------------------------------------------------------
// validatePosition()
// -----------------------------------------------------------------------------
void RiskService::validatePosition(const domain::Position& position) {
  recordCheck();
  try {
    checker_.validatePosition(position);
  } catch (const RiskViolationError& e) {
    recordViolation(false);

    nlohmann::json data = violationData(e);
    data["net_quantity"] = position.net_quantity.toString();
    data["unrealized_pnl"] = position.unrealized_pnl.toString();
    data["margin"] = position.margin.toString();
    data["maintenance_margin"] = position.maintenance_margin.toString();

    emitRiskEvent(buildEvent(e, RiskEventType::PositionValidation,
                             RiskSeverity::High, RiskAction::ReduceExposure,
                             std::move(data)));
    throw;
  }
}

// -----------------------------------------------------------------------------
// checkExposure()
// -----------------------------------------------------------------------------
std::optional<RiskReading> RiskService::checkExposure(
    const std::string& strategy_id) {
  recordCheck();
  std::optional<RiskReading> reading;
  try {
    reading = checker_.checkExposure(strategy_id);
  } catch (const RiskViolationError& e) {
    recordViolation(false);
    {
      std::unique_lock lock(state_mutex_);
      exposure_[strategy_id] = RiskReading{e.currentValue(), e.limitValue()};
    }
    emitRiskEvent(buildEvent(e, RiskEventType::ExposureLimit,
                             RiskSeverity::High, RiskAction::ReduceExposure,
                             violationData(e)));
    throw;
  }

  if (reading) {
    std::unique_lock lock(state_mutex_);
    exposure_[strategy_id] = *reading;
  }
  return reading;
}

// -----------------------------------------------------------------------------
// checkDrawdown()
// -----------------------------------------------------------------------------
std::optional<RiskReading> RiskService::checkDrawdown(
    const std::string& strategy_id) {
  recordCheck();
  std::optional<RiskReading> reading;
  try {
    reading = checker_.checkDrawdown(strategy_id);
  } catch (const RiskViolationError& e) {
    recordViolation(false);
    {
      std::unique_lock lock(state_mutex_);
      drawdown_[strategy_id] = RiskReading{e.currentValue(), e.limitValue()};
    }
    emitRiskEvent(buildEvent(e, RiskEventType::DrawdownLimit,
                             RiskSeverity::Critical, RiskAction::StopStrategy,
                             violationData(e)));
    throw;
  }

  if (reading) {
    std::unique_lock lock(state_mutex_);
    drawdown_[strategy_id] = *reading;
  }
  return reading;
}

// -----------------------------------------------------------------------------
// emitRiskEvent(): map first, then non-blocking hand-off to the channels
// -----------------------------------------------------------------------------
void RiskService::emitRiskEvent(RiskEvent event) {
  if (event.id.empty()) {
    event.id = event_ids_.next_id();
  }
  if (event.created_at == Timestamp{}) {
    event.created_at = checker_.now();
  }

  {
    std::unique_lock lock(state_mutex_);
    if (events_.insert_or_assign(event.id, event).second) {
      event_order_.push_back(event.id);
      evictOverflowLocked();
    }
    risk_score_ = std::min(kMaxScore, risk_score_ * kScoreDecay +
                                          severityWeight(event.severity));
  }

  const bool queued = event_channel_.tryPush(event);
  const bool escalated =
      !event.isEscalation() || violation_channel_.tryPush(event);

  if (!queued || !escalated) {
    std::unique_lock lock(state_mutex_);
    if (!queued) {
      ++dropped_events_;
    }
    if (!escalated) {
      ++dropped_violations_;
    }
  }

  if (event.isEscalation()) {
    std::cerr << "[RiskService] WARNING: " << toString(event.severity)
              << " risk event " << event.id << " (" << toString(event.type)
              << ") for " << event.strategy_id << ": " << event.description
              << "\n";
  } else {
    std::cout << "[RiskService] risk event " << event.id << " ("
              << toString(event.type) << ") for " << event.strategy_id
              << ": " << event.description << "\n";
  }
  if (!queued) {
    std::cerr << "[RiskService] WARNING: event channel full, dropped "
              << event.id << " from the live stream.\n";
  }
  if (!escalated) {
    std::cerr << "[RiskService] WARNING: violation channel full, dropped "
              << event.id << " from escalation.\n";
  }
}

// -----------------------------------------------------------------------------
// getMetrics(): consistent snapshot under a shared lock
// -----------------------------------------------------------------------------
RiskMetrics RiskService::getMetrics() const {
  std::shared_lock lock(state_mutex_);
  RiskMetrics m;
  m.total_checks = total_checks_;
  m.violations = violations_;
  m.blocked_orders = blocked_orders_;
  m.violation_rate =
      total_checks_ == 0
          ? 0.0
          : static_cast<double>(violations_) / static_cast<double>(total_checks_);
  m.risk_score = risk_score_;
  m.active_events = static_cast<std::int64_t>(
      std::count_if(events_.begin(), events_.end(),
                    [](const auto& entry) { return !entry.second.resolved; }));
  m.dropped_events = dropped_events_;
  m.dropped_violations = dropped_violations_;
  m.evicted_events = evicted_events_;
  return m;
}

// -----------------------------------------------------------------------------
// Event map accessors
// -----------------------------------------------------------------------------
bool RiskService::resolveEvent(const std::string& event_id) {
  std::unique_lock lock(state_mutex_);
  auto it = events_.find(event_id);
  if (it == events_.end()) {
    return false;
  }
  it->second.resolved = true;
  return true;
}

std::vector<RiskEvent> RiskService::listEvents(bool unresolved_only) const {
  std::shared_lock lock(state_mutex_);
  std::vector<RiskEvent> result;
  result.reserve(event_order_.size());
  for (const auto& id : event_order_) {
    const RiskEvent& event = events_.at(id);
    if (unresolved_only && event.resolved) {
      continue;
    }
    result.push_back(event);
  }
  return result;
}

std::size_t RiskService::pruneResolved() {
  std::unique_lock lock(state_mutex_);
  std::size_t removed = 0;
  for (auto it = events_.begin(); it != events_.end();) {
    if (it->second.resolved) {
      it = events_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  event_order_.erase(
      std::remove_if(event_order_.begin(), event_order_.end(),
                     [this](const std::string& id) {
                       return events_.find(id) == events_.end();
                     }),
      event_order_.end());
  return removed;
}

std::optional<RiskReading> RiskService::exposureSnapshot(
    const std::string& strategy_id) const {
  std::shared_lock lock(state_mutex_);
  auto it = exposure_.find(strategy_id);
  if (it == exposure_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<RiskReading> RiskService::drawdownSnapshot(
    const std::string& strategy_id) const {
  std::shared_lock lock(state_mutex_);
  auto it = drawdown_.find(strategy_id);
  if (it == drawdown_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<RiskEvent> RiskService::nextViolation(
    std::chrono::milliseconds timeout) {
  return violation_channel_.waitPopFor(timeout);
}

std::optional<RiskEvent> RiskService::tryNextViolation() {
  return violation_channel_.tryPop();
}

// -----------------------------------------------------------------------------
// runEventLoop(): event thread body
// -----------------------------------------------------------------------------
void RiskService::runEventLoop() {
  while (!stopping_.load()) {
    std::optional<RiskEvent> event = event_channel_.waitPop(stopping_);
    if (!event) {
      break;
    }
    handleEvent(*event);
  }
}

// -----------------------------------------------------------------------------
// handleEvent(): persist, then one handler per action
// -----------------------------------------------------------------------------
void RiskService::handleEvent(const RiskEvent& event) {
  if (store_ != nullptr) {
    try {
      store_->save(event);
    } catch (const std::exception& e) {
      std::cerr << "[RiskService] ERROR: failed to persist " << event.id
                << ": " << e.what() << "\n";
    }
  }

  switch (event.action) {
    case RiskAction::StopStrategy:
      std::cerr << "[RiskService] ERROR: stop strategy signal for "
                << event.strategy_id << ": " << event.description << "\n";
      break;
    case RiskAction::ReduceExposure:
      std::cerr << "[RiskService] WARNING: reduce exposure signal for "
                << event.strategy_id << ": " << event.description << "\n";
      break;
    case RiskAction::MonitorPosition:
      std::cout << "[RiskService] monitoring " << event.strategy_id
                << (event.symbol ? " " + *event.symbol : std::string())
                << ": " << event.description << "\n";
      break;
    case RiskAction::BlockOrder:
      // Already refused on the caller's thread.
      break;
  }
}

// -----------------------------------------------------------------------------
// runMonitor(): exposure / drawdown thread body
// -----------------------------------------------------------------------------
void RiskService::runMonitor(
    const char* name, std::chrono::milliseconds interval,
    const std::function<void(const std::string&)>& check) {
  std::unique_lock lock(stop_mutex_);
  while (!stop_cv_.wait_for(lock, interval,
                            [this] { return stopping_.load(); })) {
    lock.unlock();

    for (const auto& strategy_id : monitoredStrategies()) {
      if (stopping_.load()) {
        break;
      }
      try {
        check(strategy_id);
      } catch (const RiskViolationError&) {
        // Recorded and emitted by the check.
      } catch (const std::exception& e) {
        std::cerr << "[RiskService] ERROR: " << name << " check failed for "
                  << strategy_id << ": " << e.what() << "\n";
      }
    }

    lock.lock();
  }
}

std::vector<std::string> RiskService::monitoredStrategies() const {
  if (directory_ != nullptr) {
    try {
      return directory_->activeStrategies();
    } catch (const DependencyUnavailableError& e) {
      std::cerr << "[RiskService] WARNING: strategy directory unavailable, "
                   "polling tracked strategies: "
                << e.what() << "\n";
    }
  }

  std::set<std::string> tracked;
  std::shared_lock lock(state_mutex_);
  for (const auto& entry : exposure_) {
    tracked.insert(entry.first);
  }
  for (const auto& entry : drawdown_) {
    tracked.insert(entry.first);
  }
  return std::vector<std::string>(tracked.begin(), tracked.end());
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
RiskEvent RiskService::buildEvent(const RiskViolationError& violation,
                                  RiskEventType type, RiskSeverity severity,
                                  RiskAction action, nlohmann::json data) {
  RiskEvent event;
  event.id = event_ids_.next_id();
  event.type = type;
  event.severity = severity;
  event.strategy_id = violation.strategyId();
  if (!violation.symbol().empty()) {
    event.symbol = violation.symbol();
  }
  event.description = violation.what();
  event.data = std::move(data);
  event.action = action;
  event.created_at = checker_.now();
  return event;
}

void RiskService::evictOverflowLocked() {
  while (events_.size() > config_.max_stored_events) {
    auto victim = std::find_if(
        event_order_.begin(), event_order_.end(),
        [this](const std::string& id) { return events_.at(id).resolved; });
    if (victim == event_order_.end()) {
      victim = event_order_.begin();
    }
    events_.erase(*victim);
    event_order_.erase(victim);
    ++evicted_events_;
  }
}

void RiskService::recordCheck() {
  std::unique_lock lock(state_mutex_);
  ++total_checks_;
}

void RiskService::recordViolation(bool blocked_order) {
  std::unique_lock lock(state_mutex_);
  ++violations_;
  if (blocked_order) {
    ++blocked_orders_;
  }
}

}  // namespace tradeguard
