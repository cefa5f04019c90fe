// -----------------------------------------------------------------------------
// breakout_tracker: single executable entry point.
//
//   breakout_tracker [settings.json]
//
//   1) Load Settings (defaults when no file is given).
//   2) Pick the clock: the wall clock for live trading, or a
//      SimulationTimeProvider that MarketDataGateway advances per tick when
//      network.simulation_clock is set (replaying a recorded session).
//   3) Build and start the TrackerEngine. It owns every thread: market
//      data, ingest partitions, publish loop, timers and the IPC server.
//   4) Park the main thread until SIGINT/SIGTERM, then stop the engine
//      (final checkpoint, all threads joined).
//
// Thread layout:
//   main thread          → waits for a shutdown signal
//   market data thread   → MarketDataGateway::run() (ZMQ SUB recv loop)
//   ingest workers       → TickArchive::append + StrategyManager::onTick
//   publish loop         → ConsoleAlertSink, IpcServer telemetry bridge
//   timers               → phase advance, checkpoint, maintenance
//   IPC thread           → REP commands, PUB telemetry
// -----------------------------------------------------------------------------

#include "breakout/config/settings.hpp"
#include "breakout/domain/errors.hpp"
#include "breakout/engine/tracker_engine.hpp"
#include "breakout/time/live_time_provider.hpp"
#include "breakout/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

// -----------------------------------------------------------------------------
// The only global: set by the signal handler, polled by main().
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Settings
  // -------------------------------------------------------------------------
  breakout::Settings settings;
  try {
    if (argc > 1) {
      settings = breakout::Settings::loadFile(argv[1]);
    } else {
      std::cout << "[main] no settings file given, using defaults\n";
    }
  } catch (const breakout::ConfigError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Clock
  // -------------------------------------------------------------------------
  breakout::LiveTimeProvider live_clock;
  breakout::SimulationTimeProvider sim_clock;
  const bool replay = settings.simulation_clock;
  const breakout::ITimeProvider& clock =
      replay ? static_cast<const breakout::ITimeProvider&>(sim_clock)
             : static_cast<const breakout::ITimeProvider&>(live_clock);

  // -------------------------------------------------------------------------
  // 3) Engine
  // -------------------------------------------------------------------------
  std::unique_ptr<breakout::TrackerEngine> engine;
  try {
    engine = std::make_unique<breakout::TrackerEngine>(
        clock, settings, replay ? &sim_clock : nullptr);
    engine->start();
  } catch (const breakout::ConfigError& e) {
    std::cerr << "[main] ERROR: configuration: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] ERROR: cannot open socket: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Wait for Ctrl-C / SIGTERM
  // -------------------------------------------------------------------------
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] running" << (replay ? " (replay clock)" : "")
            << ". Press Ctrl-C to shut down.\n";

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine->stop();
  return 0;
}
