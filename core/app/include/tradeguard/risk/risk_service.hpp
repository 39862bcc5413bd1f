#pragma once

#include "tradeguard/concurrent/bounded_queue.hpp"
#include "tradeguard/concurrent/cancellation.hpp"
#include "tradeguard/concurrent/id_generator.hpp"
#include "tradeguard/domain/errors.hpp"
#include "tradeguard/domain/order.hpp"
#include "tradeguard/domain/position.hpp"
#include "tradeguard/risk/i_order_validator.hpp"
#include "tradeguard/risk/risk_checker.hpp"
#include "tradeguard/risk/risk_data_sources.hpp"
#include "tradeguard/risk/risk_event.hpp"
#include "tradeguard/risk/risk_metrics.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// RiskServiceConfig
// -----------------------------------------------------------------------------
// Channel capacities, monitor intervals and the event map bound. Loaded
// from the "risk_service" section of the engine configuration.
// -----------------------------------------------------------------------------
struct RiskServiceConfig {
  std::size_t event_buffer_size{1000};
  std::size_t violation_buffer_size{100};
  std::chrono::milliseconds exposure_check_interval{5000};
  std::chrono::milliseconds drawdown_check_interval{10000};
  std::size_t max_stored_events{10000};
};

// -----------------------------------------------------------------------------
// RiskService
// -----------------------------------------------------------------------------
//
// @brief  Stateful risk orchestrator: wraps RiskChecker with counters,
//         records every violation as a RiskEvent, and runs continuous
//         exposure / drawdown surveillance in the background.
//
// @details
// Synchronous path (caller threads):
//   validateOrder / validatePosition / checkExposure / checkDrawdown each
//   increment total_checks, delegate to the checker and, on
//   RiskViolationError, increment violations (validateOrder also
//   blocked_orders), build a RiskEvent, emitRiskEvent() it and rethrow.
//
//     call               type                 severity  action
//     validateOrder      order_validation     medium    block_order
//       (exposure rule)  exposure_limit       high      block_order
//     validatePosition   position_validation  high      reduce_exposure
//     checkExposure      exposure_limit       high      reduce_exposure
//     checkDrawdown      drawdown_limit       critical  stop_strategy
//
// emitRiskEvent() never blocks on a consumer. The event is stored in the
// event map first, then offered to the event channel with tryPush(); a
// full channel drops the live copy and increments dropped_events. High and
// Critical events are also offered to the violation channel (drops counted
// in dropped_violations). Readers of the violation channel use
// nextViolation() / tryNextViolation().
//
// Background threads (after start()):
//
//   event thread     waitPop() on the event channel; persists each event
//                    through IRiskEventStore and executes its action
//   exposure thread  every exposure_check_interval, checkExposure() for
//                    each monitored strategy
//   drawdown thread  every drawdown_check_interval, checkDrawdown() for
//                    each monitored strategy
//
// Monitored strategies come from the IStrategyDirectory when one is given,
// otherwise from the strategies already present in the exposure / drawdown
// snapshot maps. A check stores its reading in the snapshot map whether it
// passes or violates, so a strategy in breach keeps being polled.
//
// The event map holds at most max_stored_events entries. A strategy that
// stays in breach adds one event per monitor interval; past the bound the
// oldest resolved event is evicted first, then the oldest unresolved one
// (counted in evicted_events). Eviction only affects the in-memory map;
// the store has already been offered every event.
//
// Thread model:
//   One std::shared_mutex (state_mutex_) guards the event map, the two
//   snapshot maps, the counters and the risk score. Readers (getMetrics,
//   listEvents, snapshots) take a shared_lock; writers take a unique_lock.
//   Store writes and log output always happen outside that lock.
//
//   The monitors sleep on stop_cv_.wait_for(interval) with stopping_ as the
//   predicate; the event thread sleeps in BoundedQueue::waitPop(stopping_).
//   stop() sets stopping_, wakes both, and joins all three threads.
//
// Ownership:
//   Holds references to the RiskChecker and the optional store / directory;
//   all must outlive the service. Owns both channels and all threads.
// -----------------------------------------------------------------------------
class RiskService final : public IOrderValidator {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  checker    Rule evaluator. Must outlive this service.
  // @param  config     Channel sizes and monitor intervals.
  // @param  store      Optional persistence for processed events.
  // @param  directory  Optional list of strategies for the monitors.
  //
  // @throws ValidationError on a zero channel size, a non-positive interval
  //         or a zero max_stored_events.
  //
  // No threads are spawned here. Call start().
  // -------------------------------------------------------------------------
  RiskService(RiskChecker& checker, RiskServiceConfig config,
              IRiskEventStore* store = nullptr,
              const IStrategyDirectory* directory = nullptr);

  // RAII: calls stop().
  ~RiskService();

  RiskService(const RiskService&) = delete;
  RiskService& operator=(const RiskService&) = delete;
  RiskService(RiskService&&) = delete;
  RiskService& operator=(RiskService&&) = delete;

  // -------------------------------------------------------------------------
  // start(cancel)
  // -------------------------------------------------------------------------
  // @brief  Spawns the event, exposure and drawdown threads.
  //
  // @param  cancel  Optional external token. Cancelling it has the same
  //                 effect as the stop signal; the threads still have to be
  //                 joined by stop() or the destructor.
  //
  // Idempotent: a second start() while threads exist is a no-op.
  // -------------------------------------------------------------------------
  void start(CancellationToken cancel = {});

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Signals all three threads and joins them.
  //
  // Returns only after every background thread has exited. Idempotent, and
  // safe to call before start().
  // -------------------------------------------------------------------------
  void stop();

  // True between start() and stop(), unless the stop signal has fired.
  bool isRunning() const;

  // @throws RiskViolationError after recording the violation.
  void validateOrder(const domain::Order& order) override;
  void validatePosition(const domain::Position& position);
  std::optional<RiskReading> checkExposure(const std::string& strategy_id);
  std::optional<RiskReading> checkDrawdown(const std::string& strategy_id);

  // -------------------------------------------------------------------------
  // emitRiskEvent(event)
  // -------------------------------------------------------------------------
  // @brief  Records event and hands it to the channels without blocking.
  //
  // @details
  // An empty id is replaced with a generated "risk-<n>" id and an unset
  // created_at with the checker's clock. Updates the risk score:
  //   score = min(100, score * 0.9 + severityWeight(severity))
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  void emitRiskEvent(RiskEvent event);

  RiskMetrics getMetrics() const;

  // Marks the event resolved. false when no such event is stored.
  bool resolveEvent(const std::string& event_id);

  // Stored events in emission order.
  std::vector<RiskEvent> listEvents(bool unresolved_only = false) const;

  // Removes resolved events from the map. Returns how many were removed.
  std::size_t pruneResolved();

  // Last checkExposure / checkDrawdown reading for a strategy, including
  // one that violated its limit.
  std::optional<RiskReading> exposureSnapshot(
      const std::string& strategy_id) const;
  std::optional<RiskReading> drawdownSnapshot(
      const std::string& strategy_id) const;

  // -------------------------------------------------------------------------
  // nextViolation(timeout) / tryNextViolation()
  // -------------------------------------------------------------------------
  // @brief  Consumer side of the violation channel (High / Critical events
  //         only). Each event is delivered to exactly one caller.
  // -------------------------------------------------------------------------
  std::optional<RiskEvent> nextViolation(std::chrono::milliseconds timeout);
  std::optional<RiskEvent> tryNextViolation();

 private:
  void runEventLoop();

  // -------------------------------------------------------------------------
  // runMonitor(name, interval, check)
  // -------------------------------------------------------------------------
  // Shared body of the exposure and drawdown threads. Waits interval (or
  // until stopping_), then runs check for every monitored strategy.
  // Violations are already recorded by check itself and are not rethrown.
  // -------------------------------------------------------------------------
  void runMonitor(const char* name, std::chrono::milliseconds interval,
                  const std::function<void(const std::string&)>& check);

  std::vector<std::string> monitoredStrategies() const;

  // Persist, then execute the action. Runs on the event thread.
  void handleEvent(const RiskEvent& event);

  RiskEvent buildEvent(const RiskViolationError& violation,
                       RiskEventType type, RiskSeverity severity,
                       RiskAction action, nlohmann::json data);

  void recordCheck();
  void recordViolation(bool blocked_order);

  // Trims events_ to max_stored_events. Caller holds state_mutex_.
  void evictOverflowLocked();

  // Sets stopping_ and wakes every waiter. Also the cancellation callback.
  void requestStop();

  RiskChecker& checker_;
  const RiskServiceConfig config_;
  IRiskEventStore* store_;
  const IStrategyDirectory* directory_;
  IdGenerator event_ids_{"risk"};

  // --- Shared state, guarded by state_mutex_ --------------------------------
  mutable std::shared_mutex state_mutex_;
  std::map<std::string, RiskEvent> events_;
  std::vector<std::string> event_order_;
  std::map<std::string, RiskReading> exposure_;
  std::map<std::string, RiskReading> drawdown_;
  std::int64_t total_checks_{0};
  std::int64_t violations_{0};
  std::int64_t blocked_orders_{0};
  std::int64_t dropped_events_{0};
  std::int64_t dropped_violations_{0};
  std::int64_t evicted_events_{0};
  double risk_score_{0.0};

  // --- Channels --------------------------------------------------------------
  BoundedQueue<RiskEvent> event_channel_;
  BoundedQueue<RiskEvent> violation_channel_;

  // --- Lifecycle -------------------------------------------------------------
  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  CancellationToken cancel_token_;
  CancellationToken::Registration cancel_registration_{0};

  std::thread event_thread_;
  std::thread exposure_thread_;
  std::thread drawdown_thread_;
};

}  // namespace tradeguard
