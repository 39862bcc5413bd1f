#include "tradeguard/engine/pretrade_engine.hpp"
#include "tradeguard/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <utility>

namespace tradeguard {

// -----------------------------------------------------------------------------
// Constructor: wire collaborators → checker → services
// -----------------------------------------------------------------------------
PretradeEngine::PretradeEngine(EngineConfig config, const ITimeProvider& clock)
    : config_(std::move(config)), clock_(clock), order_rate_(clock) {
  for (const auto& [strategy_id, limits] : config_.strategy_limits) {
    limits_store_.setLimits(strategy_id, limits);
    risk_data_.addStrategy(strategy_id);
  }

  RiskDataSources sources;
  sources.limits_store = &limits_store_;
  sources.exposure = &risk_data_;
  sources.drawdown = &risk_data_;
  sources.positions = &risk_data_;
  sources.order_rate = &order_rate_;

  checker_ = std::make_unique<RiskChecker>(sources, config_.default_limits,
                                           &clock_);
  risk_service_ = std::make_unique<RiskService>(
      *checker_, config_.risk_service, &event_store_, &risk_data_);
  order_service_ = std::make_unique<OrderService>(
      *checker_, order_ids_, config_.commission, &risk_data_, &clock_);
}

PretradeEngine::~PretradeEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void PretradeEngine::start(CancellationToken cancel) {
  if (running_) {
    return;
  }

  // ---  1) Risk service threads (events, exposure, drawdown) ---------------
  risk_service_->start(std::move(cancel));

  // ---  2) IpcServer: commands + escalation stream --------------------------
  if (!config_.ipc.command_endpoint.empty() &&
      !config_.ipc.publish_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        config_.ipc.command_endpoint, config_.ipc.publish_endpoint,
        [this](const std::string& cmd) { return executeCommand(cmd); },
        [this]() -> std::optional<std::string> {
          auto event = risk_service_->tryNextViolation();
          if (!event) {
            return std::nullopt;
          }
          return event->toJson().dump(
              -1, ' ', false, nlohmann::json::error_handler_t::replace);
        });
    ipc_server_->start();
  }

  running_ = true;

  std::cout << "[PretradeEngine] started. Threads: risk events, exposure, "
               "drawdown"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void PretradeEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) IPC first: its thread calls executeCommand() ---------------------
  ipc_server_.reset();

  // ---  2) Risk service (joins its three threads) ---------------------------
  risk_service_->stop();

  running_ = false;

  std::cout << "[PretradeEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// createOrder / submitOrder / canPlaceOrder
// -----------------------------------------------------------------------------
domain::Order PretradeEngine::createOrder(const CreateOrderRequest& request) {
  return order_service_->createOrder(request);
}

void PretradeEngine::submitOrder(domain::Order& order) {
  if (order.status() != domain::OrderStatus::Pending) {
    throw InvalidStateTransitionError(domain::toString(order.status()),
                                      "submit");
  }

  try {
    risk_service_->validateOrder(order);
  } catch (const RiskViolationError& e) {
    order.reject(e.what());
    std::cerr << "[PretradeEngine] WARNING: " << order.id()
              << " rejected at submission: " << e.what() << "\n";
    throw;
  }

  order_rate_.recordOrder(order.strategyId());
  std::cout << "[PretradeEngine] " << order.id() << " submitted for "
            << order.strategyId() << ".\n";
}

bool PretradeEngine::canPlaceOrder(const std::string& strategy_id,
                                   const domain::Order& order) {
  return order_service_->canPlaceOrder(strategy_id, order);
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string PretradeEngine::executeCommand(const std::string& cmd) {
  static const std::string kResolvePrefix = "RESOLVE ";
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "METRICS") {
    response["status"] = "ok";
    response["metrics"] = risk_service_->getMetrics().toJson();
  } else if (cmd == "EVENTS") {
    nlohmann::json events = nlohmann::json::array();
    for (const auto& event : risk_service_->listEvents(true)) {
      events.push_back(event.toJson());
    }
    response["status"] = "ok";
    response["events"] = std::move(events);
  } else if (cmd.compare(0, kResolvePrefix.size(), kResolvePrefix) == 0) {
    const std::string id = cmd.substr(kResolvePrefix.size());
    if (risk_service_->resolveEvent(id)) {
      response["status"] = "ok";
      response["resolved"] = id;
    } else {
      response["status"] = "error";
      response["response"] = "Unknown event: " + id;
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  // Commands arrive as raw bytes; echoed text may not be valid UTF-8.
  return response.dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace);
}

}  // namespace tradeguard
