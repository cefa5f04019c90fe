#pragma once

#include "breakout/alerts/console_alert_sink.hpp"
#include "breakout/alerts/notifier.hpp"
#include "breakout/concurrent/event_loop_thread.hpp"
#include "breakout/concurrent/periodic_timer.hpp"
#include "breakout/config/settings.hpp"
#include "breakout/domain/strategy_snapshot.hpp"
#include "breakout/domain/tick.hpp"
#include "breakout/ingest/tick_ingestor.hpp"
#include "breakout/instruments/instrument_catalog.hpp"
#include "breakout/instruments/instrument_resolver.hpp"
#include "breakout/network/ipc_server.hpp"
#include "breakout/network/market_data_thread.hpp"
#include "breakout/persistence/checkpoint_store.hpp"
#include "breakout/persistence/tick_archive.hpp"
#include "breakout/strategy/strategy_manager.hpp"
#include "breakout/time/i_time_provider.hpp"
#include "breakout/time/simulation_time_provider.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace breakout {

// -----------------------------------------------------------------------------
// TrackerEngine: top-level orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Builds the component graph from Settings, owns every thread and
//         manages startup and shutdown order.
//
// @details
// Data flow:
//
//   MarketDataThread ──ingest()──► TickIngestor ──partition workers──┐
//                                                                   │
//            TickArchive::append() ◄────────────────────────────────┤
//            StrategyManager::onTick() ◄────────────────────────────┘
//                    │ notifications, snapshots, phase changes
//                    ▼
//            publish loop (EventLoopThread) ──EventBus──► ConsoleAlertSink
//                                                     └──► IpcServer (PUB)
//
//   Timers: phase (advancePhases + engine status), checkpoint, maintenance
//   (retention purge, index roll, archive prune).
//
//   IpcServer (REP) ──► executeCommand() ──► StrategyManager control surface
//
// Startup order (start()):
//   1. Restore the checkpoint, so restored strategies exist before ticks.
//   2. Start the publish loop and the ingestor workers.
//   3. Create the configured startup strategies, on a cold start only (no
//      checkpoint restored). Configs with no spot price yet are parked and
//      retried by the phase timer.
//   4. Start the timers, then the IPC server.
//   5. Start MarketDataThread LAST (ticks begin flowing).
//
// Shutdown order (stop()): reverse of startup, with a final checkpoint and
// archive flush after the ingestor has drained.
//
// Endpoints and paths left empty in Settings disable the matching part, so
// unit tests drive the engine in-process through ingest() and
// executeCommand() with no sockets and no files.
//
// Thread model:
//   start()/stop() from the owning thread (main). ingest(),
//   executeCommand() and status() from any thread.
//
// Ownership:
//   Owns the catalog, resolver, notifier, strategy manager, archive,
//   checkpoint store, ingestor, publish loop, timers, alert sink and the
//   network threads. Holds a reference to the clock (owned by main()).
// -----------------------------------------------------------------------------
class TrackerEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  clock      Time source for every component.
  // @param  settings   Engine configuration.
  // @param  sim_clock  When non-null, MarketDataGateway advances it per tick
  //                    (replay mode). Usually the same object as `clock`.
  //
  // @throws ConfigError if the contracts file or a series is invalid.
  // -------------------------------------------------------------------------
  TrackerEngine(const ITimeProvider& clock, Settings settings,
                SimulationTimeProvider* sim_clock = nullptr);

  ~TrackerEngine();

  TrackerEngine(const TrackerEngine&) = delete;
  TrackerEngine& operator=(const TrackerEngine&) = delete;
  TrackerEngine(TrackerEngine&&) = delete;
  TrackerEngine& operator=(TrackerEngine&&) = delete;

  // Idempotent.
  void start();
  void stop();

  // In-process tick source (the gateway's sink).
  void ingest(domain::Tick tick);

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  // @brief  Serves one JSON control request; returns the JSON reply.
  //
  // Actions: ping, status, list_strategies, get_strategy, create_strategy,
  // update_strategy, remove_strategy, get_preview. Never throws: failures
  // become {"status":"error","error":<kind>,"message":...}.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  domain::EngineStatus status() const;

  // Writes a checkpoint now. False when disabled or every attempt failed.
  bool checkpointNow();

  // Creates parked startup strategies whose index now has a spot price.
  // Runs on the phase timer; returns how many were created.
  std::size_t retryStartupStrategies();
  std::size_t pendingStartupCount() const;

  // Retention purge, index roll and archive prune (the maintenance timer).
  void runMaintenance();

  // Waits until every ingested tick is processed and the publish queue is
  // empty. Returns false on timeout.
  bool waitIdle(std::chrono::milliseconds timeout) const;

  StrategyManager& strategies() { return *manager_; }
  InstrumentCatalog& catalog() { return catalog_; }
  EventBus& eventBus() { return publish_loop_.eventBus(); }
  const Settings& settings() const { return settings_; }

 private:
  void buildCatalog();
  bool restoreCheckpoint();
  void createStartupStrategies();
  void publishStatusIfChanged();

  const ITimeProvider& clock_;
  Settings settings_;
  SimulationTimeProvider* sim_clock_;

  InstrumentCatalog catalog_;
  std::unique_ptr<InstrumentResolver> resolver_;
  Notifier notifier_;

  EventLoopThread publish_loop_;
  std::unique_ptr<TickArchive> archive_;
  std::unique_ptr<CheckpointStore> checkpoint_;
  std::unique_ptr<StrategyManager> manager_;

  std::unique_ptr<TickIngestor> ingestor_;
  std::unique_ptr<ConsoleAlertSink> alert_sink_;
  std::unique_ptr<PeriodicTimer> phase_timer_;
  std::unique_ptr<PeriodicTimer> checkpoint_timer_;
  std::unique_ptr<PeriodicTimer> maintenance_timer_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> ipc_subscription_;
  std::unique_ptr<MarketDataThread> market_data_thread_;

  mutable std::mutex startup_mutex_;  // Guards pending_startup_
  std::vector<domain::StrategyConfig> pending_startup_;

  std::mutex status_mutex_;  // Guards last_status_
  std::optional<domain::EngineStatus> last_status_;

  bool running_{false};
};

}  // namespace breakout
