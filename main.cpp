// -----------------------------------------------------------------------------
// tradeguard: single executable entry point.
//
// Runs the pre-trade risk core as a long-lived service:
//   1) Load the EngineConfig from the JSON file named on the command line
//      (built-in defaults when no path is given).
//   2) Create a LiveTimeProvider and the PretradeEngine.
//   3) Start the engine with a CancellationToken. The risk service spawns
//      its event, exposure and drawdown threads; the IpcServer answers
//      commands and publishes escalated risk events.
//   4) Wait on the main thread until SIGINT / SIGTERM.
//   5) Cancel, then stop the engine (joins every thread).
//
// Thread layout:
//   main thread        → waits for the shutdown flag
//   risk events thread → RiskService event processing
//   exposure thread    → RiskService exposure monitor
//   drawdown thread    → RiskService drawdown monitor
//   ipc thread         → IpcServer (REP commands, PUB escalations)
// -----------------------------------------------------------------------------

#include "tradeguard/concurrent/cancellation.hpp"
#include "tradeguard/config/engine_config.hpp"
#include "tradeguard/domain/errors.hpp"
#include "tradeguard/engine/pretrade_engine.hpp"
#include "tradeguard/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag for the signal handler.
// The only global in the program. A lock-free atomic store is
// async-signal-safe, so the handler does nothing else.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  tradeguard::EngineConfig config;
  if (argc > 1) {
    try {
      config = tradeguard::loadEngineConfig(argv[1]);
    } catch (const tradeguard::ValidationError& e) {
      std::cerr << "[main] ERROR: " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] Loaded configuration from " << argv[1] << "\n";
  } else {
    std::cout << "[main] No configuration file given, using defaults.\n";
  }

  // -------------------------------------------------------------------------
  // 2) Clock and engine.
  // -------------------------------------------------------------------------
  tradeguard::LiveTimeProvider clock;
  tradeguard::CancellationSource cancel;

  try {
    tradeguard::PretradeEngine engine(config, clock);

    // -----------------------------------------------------------------------
    // 3) Install handlers before start() so an early Ctrl-C is not lost.
    // -----------------------------------------------------------------------
    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    engine.start(cancel.token());

    if (!config.ipc.command_endpoint.empty() &&
        !config.ipc.publish_endpoint.empty()) {
      std::cout << "[main] Commands on " << config.ipc.command_endpoint
                << ", escalations on " << config.ipc.publish_endpoint << "\n";
    }
    std::cout << "[main] Press Ctrl-C to shut down.\n";

    // -----------------------------------------------------------------------
    // 4) Wait for the shutdown signal.
    // -----------------------------------------------------------------------
    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // -----------------------------------------------------------------------
    // 5) Clean shutdown.
    // -----------------------------------------------------------------------
    std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
    cancel.cancel();
    engine.stop();

    const tradeguard::RiskMetrics metrics = engine.riskService().getMetrics();
    std::cout << "[main] Final metrics: " << metrics.toJson().dump() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
