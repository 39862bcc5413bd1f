#pragma once

#include "tradeguard/concurrent/cancellation.hpp"
#include "tradeguard/concurrent/id_generator.hpp"
#include "tradeguard/config/engine_config.hpp"
#include "tradeguard/domain/order.hpp"
#include "tradeguard/network/ipc_server.hpp"
#include "tradeguard/order/order_service.hpp"
#include "tradeguard/risk/in_memory_sources.hpp"
#include "tradeguard/risk/risk_checker.hpp"
#include "tradeguard/risk/risk_service.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <memory>
#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// PretradeEngine
// -----------------------------------------------------------------------------
//
// @brief  Composition root: owns the collaborators, the risk layer, the
//         order service and the optional IPC server, and exposes the
//         create → submit path plus a lifecycle API.
//
// @details
// Order path:
//   createOrder(request)  OrderService: shape checks, Order::create, then
//                         RiskChecker rules. Returns a Pending order or
//                         throws ValidationError / OrderBlockedError.
//   submitOrder(order)    RiskService::validateOrder re-checks the order at
//                         submission time. On violation the order is
//                         rejected (reason = violation message) and the
//                         RiskViolationError is rethrown; the RiskEvent is
//                         already on its way to the event thread. On
//                         success the submission is counted by the
//                         order-rate tracker and the order is handed back
//                         to the caller for execution.
//
// Thread layout after start():
//   risk events thread      RiskService event processing
//   exposure monitor thread RiskService::checkExposure polling
//   drawdown monitor thread RiskService::checkDrawdown polling
//   ipc thread              IpcServer (only if both endpoints are set)
//
// Collaborators are the in-memory implementations. Tests and the
// executable stage data through riskData(), limitsStore() and
// orderRate(); configured strategies are pre-registered for monitoring.
//
// Thread model:
//   start() / stop() from one owning thread. createOrder, submitOrder,
//   canPlaceOrder and executeCommand are safe from any thread; an Order
//   itself must only be touched by one thread at a time.
//
// Ownership:
//   PretradeEngine
//    ├── order_ids_      (IdGenerator, value member)
//    ├── limits_store_   (InMemoryRiskLimitsStore)
//    ├── risk_data_      (InMemoryRiskData)
//    ├── order_rate_     (SlidingWindowOrderRate, reads clock_)
//    ├── event_store_    (InMemoryRiskEventStore)
//    ├── checker_        (unique_ptr<RiskChecker>)
//    ├── risk_service_   (unique_ptr<RiskService>)
//    ├── order_service_  (unique_ptr<OrderService>)
//    └── ipc_server_     (unique_ptr<IpcServer>, created in start())
//
// Components are destroyed before the collaborators they point to
// (reverse member order); the IPC server goes first in stop() because its
// thread calls into the risk service.
// -----------------------------------------------------------------------------
class PretradeEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config  Limits, risk service tuning, commission and IPC
  //                 endpoints. Empty endpoints disable IPC.
  // @param  clock   Time source for the order-rate window and market
  //                 hours. Must outlive the engine.
  //
  // Builds every component; no threads are spawned and no sockets opened.
  //
  // @throws ValidationError for invalid limits or risk service settings.
  // -------------------------------------------------------------------------
  PretradeEngine(EngineConfig config, const ITimeProvider& clock);

  // RAII: calls stop().
  ~PretradeEngine();

  PretradeEngine(const PretradeEngine&) = delete;
  PretradeEngine& operator=(const PretradeEngine&) = delete;
  PretradeEngine(PretradeEngine&&) = delete;
  PretradeEngine& operator=(PretradeEngine&&) = delete;

  // Starts the risk service threads, then the IPC server. Idempotent.
  void start(CancellationToken cancel = {});

  // Stops the IPC server, then the risk service. Idempotent.
  void stop();

  bool isRunning() const { return running_; }

  domain::Order createOrder(const CreateOrderRequest& request);

  // -------------------------------------------------------------------------
  // submitOrder(order)
  // -------------------------------------------------------------------------
  // @throws InvalidStateTransitionError  order is not Pending.
  // @throws RiskViolationError           order refused; it is now Rejected.
  // -------------------------------------------------------------------------
  void submitOrder(domain::Order& order);

  bool canPlaceOrder(const std::string& strategy_id,
                     const domain::Order& order);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @return JSON response string.
  //
  // @details
  //   "PING"         → {"status":"ok","response":"PONG"}
  //   "METRICS"      → {"status":"ok","metrics":{...}}
  //   "EVENTS"       → {"status":"ok","events":[...]} (unresolved only)
  //   "RESOLVE <id>" → {"status":"ok","resolved":"<id>"} or an error when
  //                    the id is unknown
  //   other          → {"status":"error","response":"Unknown command: ..."}
  //
  // Bytes that are not valid UTF-8 come back as U+FFFD; the reply is always
  // valid JSON.
  //
  // Thread model: called on the IPC thread; everything it touches is
  //               guarded by RiskService's lock.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  RiskService& riskService() { return *risk_service_; }
  OrderService& orderService() { return *order_service_; }
  InMemoryRiskData& riskData() { return risk_data_; }
  InMemoryRiskLimitsStore& limitsStore() { return limits_store_; }
  InMemoryRiskEventStore& eventStore() { return event_store_; }
  SlidingWindowOrderRate& orderRate() { return order_rate_; }

 private:
  EngineConfig config_;
  const ITimeProvider& clock_;

  IdGenerator order_ids_{"ord"};

  // --- In-memory collaborators (outlive every component below) --------------
  InMemoryRiskLimitsStore limits_store_;
  InMemoryRiskData risk_data_;
  SlidingWindowOrderRate order_rate_;
  InMemoryRiskEventStore event_store_;

  // --- Components (heap-allocated for controlled destruction order) ---------
  std::unique_ptr<RiskChecker> checker_;
  std::unique_ptr<RiskService> risk_service_;
  std::unique_ptr<OrderService> order_service_;
  std::unique_ptr<IpcServer> ipc_server_;

  bool running_{false};
};

}  // namespace tradeguard
