#include "breakout/engine/tracker_engine.hpp"
#include "breakout/codec/json_codec.hpp"
#include "breakout/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

namespace breakout {

using nlohmann::json;

namespace {

json errorReply(const std::string& kind, const std::string& message) {
  return {{"status", "error"}, {"error", kind}, {"message", message}};
}

bool sameCounters(const domain::EngineStatus& a,
                  const domain::EngineStatus& b) {
  return a.ticks_ingested == b.ticks_ingested &&
         a.ticks_processed == b.ticks_processed &&
         a.ticks_dropped == b.ticks_dropped &&
         a.clock_skew_rejections == b.clock_skew_rejections &&
         a.handler_errors == b.handler_errors &&
         a.publish_dropped == b.publish_dropped &&
         a.live_strategies == b.live_strategies &&
         a.durability_degraded == b.durability_degraded &&
         a.last_checkpoint_ms == b.last_checkpoint_ms;
}

domain::StrategyId idField(const json& request) {
  return request.at("strategy_id").get<domain::StrategyId>();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: the passive part of the graph (no threads, no sockets)
// -----------------------------------------------------------------------------
TrackerEngine::TrackerEngine(const ITimeProvider& clock, Settings settings,
                             SimulationTimeProvider* sim_clock)
    : clock_(clock),
      settings_(std::move(settings)),
      sim_clock_(sim_clock),
      notifier_(settings_.notifier),
      publish_loop_(settings_.publish_queue_capacity) {
  buildCatalog();
  resolver_ =
      std::make_unique<InstrumentResolver>(catalog_, settings_.resolverConfig());

  if (!settings_.tick_archive_path.empty()) {
    archive_ = std::make_unique<TickArchive>(settings_.tick_archive_path,
                                             settings_.tick_archive_buffer);
  }
  if (!settings_.checkpoint.path.empty()) {
    checkpoint_ = std::make_unique<CheckpointStore>(settings_.checkpoint);
  }

  manager_ = std::make_unique<StrategyManager>(
      clock_, *resolver_, notifier_, settings_.managerConfig(),
      [this](Event event) { publish_loop_.push(std::move(event)); },
      archive_.get());
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
TrackerEngine::~TrackerEngine() { stop(); }

// -----------------------------------------------------------------------------
// buildCatalog(): contracts file, then generated series
// -----------------------------------------------------------------------------
void TrackerEngine::buildCatalog() {
  if (!settings_.contracts_file.empty()) {
    const auto loaded = catalog_.loadFromFile(settings_.contracts_file);
    std::cout << "[TrackerEngine] catalog: " << loaded << " contract(s) from "
              << settings_.contracts_file << "\n";
  }
  for (const auto& series : settings_.series) {
    int step = series.step;
    if (step <= 0) {
      auto it = settings_.indices.find(series.index);
      step = (it != settings_.indices.end() && it->second.strike_step > 0)
                 ? it->second.strike_step
                 : domain::defaultStrikeStep(series.index);
    }
    catalog_.addSeries(series.index, series.expiry,
                       settings_.optionPrefix(series.index), series.min_strike,
                       series.max_strike, step);
  }
  if (!settings_.series.empty()) {
    std::cout << "[TrackerEngine] catalog: " << catalog_.size()
              << " contract(s) after " << settings_.series.size()
              << " generated series\n";
  }
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TrackerEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Restore before any tick can reach the manager ---------------------
  const bool restored = restoreCheckpoint();

  // ---  2) Publish loop and its subscribers ---------------------------------
  alert_sink_ = std::make_unique<ConsoleAlertSink>(
      publish_loop_.eventBus(), std::cout, settings_.market.utc_offset_minutes);
  publish_loop_.start();

  // ---  3) Ingestor: archive first so seeding and preview see every tick ---
  ingestor_ = std::make_unique<TickIngestor>(clock_, settings_.ingest);
  if (archive_) {
    ingestor_->subscribe(
        [this](const domain::Tick& tick) { archive_->append(tick); });
  }
  ingestor_->subscribe(
      [this](const domain::Tick& tick) { manager_->onTick(tick); });
  ingestor_->onDrop([this](const TickDroppedEvent& e) {
    publish_loop_.push(e);
  });
  ingestor_->start();

  // ---  4) Restored strategies catch up with the clock. A restored
  //         checkpoint already holds the configured strategies (or the
  //         user's removal of them), so they are only created on a cold start.
  manager_->advancePhases();
  if (restored) {
    if (!settings_.strategies.empty()) {
      std::cout << "[TrackerEngine] checkpoint restored, "
                << settings_.strategies.size()
                << " configured strategy(ies) not re-created\n";
    }
  } else {
    createStartupStrategies();
  }

  // ---  5) Timers --------------------------------------------------------------
  phase_timer_ = std::make_unique<PeriodicTimer>(
      "phase", settings_.phase_interval, [this] {
        retryStartupStrategies();
        manager_->advancePhases();
        publishStatusIfChanged();
      });
  phase_timer_->start();

  if (checkpoint_) {
    checkpoint_timer_ = std::make_unique<PeriodicTimer>(
        "checkpoint", settings_.checkpoint_interval,
        [this] { checkpointNow(); });
    checkpoint_timer_->start();
  }

  maintenance_timer_ = std::make_unique<PeriodicTimer>(
      "maintenance", settings_.maintenance_interval,
      [this] { runMaintenance(); });
  maintenance_timer_->start();

  // ---  6) IpcServer (telemetry + commands) ----------------------------------
  if (!settings_.command_endpoint.empty() ||
      !settings_.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        settings_.command_endpoint, settings_.telemetry_endpoint,
        settings_.market.utc_offset_minutes, settings_.publish_queue_capacity);
    ipc_server_->start();

    ipc_subscription_ = publish_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  // ---  7) Start MarketDataThread LAST (ticks begin flowing) ----------------
  if (!settings_.market_data_endpoint.empty()) {
    market_data_thread_ = std::make_unique<MarketDataThread>(
        sim_clock_, [this](domain::Tick tick) { ingest(std::move(tick)); },
        settings_.market_data_endpoint);
    market_data_thread_->start();
  }

  running_ = true;

  std::cout << "[TrackerEngine] started. strategies="
            << manager_->liveCount() << " partitions="
            << ingestor_->partitionCount()
            << (market_data_thread_ ? " market_data=on" : "")
            << (ipc_server_ ? " ipc=on" : "") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TrackerEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop tick inflow FIRST -------------------------------------------
  market_data_thread_.reset();

  // ---  2) IPC server joins before the components executeCommand() uses ----
  if (ipc_subscription_) {
    publish_loop_.eventBus().unsubscribe(*ipc_subscription_);
    ipc_subscription_.reset();
  }
  ipc_server_.reset();

  // ---  3) Timers ------------------------------------------------------------
  maintenance_timer_.reset();
  checkpoint_timer_.reset();
  phase_timer_.reset();

  // ---  4) Drain the ingestor, then persist --------------------------------
  ingestor_->stop();
  if (archive_ && !archive_->flush()) {
    std::cerr << "[TrackerEngine] WARNING: tick archive flush failed at "
                 "shutdown\n";
  }
  if (checkpoint_) {
    checkpointNow();
  }

  // ---  5) Publish loop drains, then the sink unsubscribes --------------------
  publish_loop_.stop();
  alert_sink_.reset();
  ingestor_.reset();

  running_ = false;

  std::cout << "[TrackerEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// ingest()
// -----------------------------------------------------------------------------
void TrackerEngine::ingest(domain::Tick tick) {
  if (!ingestor_) {
    std::cerr << "[TrackerEngine] WARNING: tick " << tick.instrument_id
              << " received before start(), ignored\n";
    return;
  }
  ingestor_->ingest(std::move(tick));
}

// -----------------------------------------------------------------------------
// restoreCheckpoint(): true when a checkpoint was loaded
// -----------------------------------------------------------------------------
bool TrackerEngine::restoreCheckpoint() {
  if (!checkpoint_) {
    return false;
  }
  auto checkpoint = checkpoint_->load();
  if (!checkpoint) {
    return false;
  }
  const auto restored =
      manager_->restore(checkpoint->strategies, checkpoint->next_id);
  std::cout << "[TrackerEngine] restored " << restored
            << " strategy(ies), next id " << manager_->nextId() << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// createStartupStrategies()
// -----------------------------------------------------------------------------
// A config that fails only for lack of a spot price is parked and retried by
// the phase timer once the spot book has a tick for its index.
void TrackerEngine::createStartupStrategies() {
  std::lock_guard lock(startup_mutex_);
  for (const auto& config : settings_.strategies) {
    try {
      manager_->create(config);
    } catch (const ResolutionError& e) {
      std::cerr << "[TrackerEngine] WARNING: startup strategy for "
                << domain::indexToString(config.index)
                << " deferred: " << e.what() << "\n";
      pending_startup_.push_back(config);
    } catch (const ConfigError& e) {
      std::cerr << "[TrackerEngine] ERROR: startup strategy for "
                << domain::indexToString(config.index)
                << " rejected: " << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// retryStartupStrategies()
// -----------------------------------------------------------------------------
std::size_t TrackerEngine::retryStartupStrategies() {
  std::lock_guard lock(startup_mutex_);
  std::size_t created = 0;
  auto it = pending_startup_.begin();
  while (it != pending_startup_.end()) {
    if (!it->spot_price && !manager_->spot(it->index)) {
      ++it;
      continue;
    }
    try {
      manager_->create(*it);
      ++created;
      it = pending_startup_.erase(it);
    } catch (const ResolutionError&) {
      // Spot known but nothing listed around it yet: keep waiting.
      ++it;
    } catch (const ConfigError& e) {
      std::cerr << "[TrackerEngine] ERROR: deferred startup strategy for "
                << domain::indexToString(it->index)
                << " rejected: " << e.what() << "\n";
      it = pending_startup_.erase(it);
    }
  }
  return created;
}

std::size_t TrackerEngine::pendingStartupCount() const {
  std::lock_guard lock(startup_mutex_);
  return pending_startup_.size();
}

// -----------------------------------------------------------------------------
// checkpointNow()
// -----------------------------------------------------------------------------
bool TrackerEngine::checkpointNow() {
  if (!checkpoint_) {
    return false;
  }
  Checkpoint checkpoint;
  checkpoint.next_id = manager_->nextId();
  checkpoint.strategies = manager_->records();
  checkpoint.written_at_ms = clock_.now_ms();
  return checkpoint_->save(checkpoint);
}

// -----------------------------------------------------------------------------
// runMaintenance()
// -----------------------------------------------------------------------------
void TrackerEngine::runMaintenance() {
  manager_->purgeExpired();
  manager_->applyIndexRoll();

  if (archive_) {
    // Keep today's ticks for preview, and anything a live lookback needs.
    const auto now = clock_.now_ms();
    std::int64_t cutoff = local_midnight_ms(
        settings_.market.dateOf(now), settings_.market.utc_offset_minutes);
    if (auto oldest = manager_->oldestLookbackStart()) {
      cutoff = std::min(cutoff, *oldest);
    }
    archive_->flush();
    archive_->prune(cutoff);
  }
}

// -----------------------------------------------------------------------------
// status() / publishStatusIfChanged()
// -----------------------------------------------------------------------------
domain::EngineStatus TrackerEngine::status() const {
  domain::EngineStatus s;
  if (ingestor_) {
    s.ticks_ingested = ingestor_->ingested();
    s.ticks_processed = ingestor_->processed();
    s.ticks_dropped = ingestor_->dropped();
    s.handler_errors = ingestor_->handlerErrors();
  }
  s.clock_skew_rejections = manager_->clockSkewRejections();
  s.handler_errors += manager_->handlerErrors();
  s.publish_dropped = publish_loop_.dropped();
  if (ipc_server_) {
    s.publish_dropped += ipc_server_->telemetryDropped();
  }
  s.live_strategies = manager_->liveCount();
  if (checkpoint_) {
    s.durability_degraded = checkpoint_->degraded();
    s.last_checkpoint_ms = checkpoint_->lastSuccessMs();
  }
  s.as_of_ms = clock_.now_ms();
  return s;
}

void TrackerEngine::publishStatusIfChanged() {
  auto current = status();
  {
    std::lock_guard lock(status_mutex_);
    if (last_status_ && sameCounters(*last_status_, current)) {
      return;
    }
    last_status_ = current;
  }
  publish_loop_.push(EngineStatusEvent{current});
}

// -----------------------------------------------------------------------------
// waitIdle()
// -----------------------------------------------------------------------------
bool TrackerEngine::waitIdle(std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  if (ingestor_ && !ingestor_->waitIdle(timeout)) {
    return false;
  }
  while (publish_loop_.pending() > 0) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

// -----------------------------------------------------------------------------
// executeCommand(): JSON control surface
// -----------------------------------------------------------------------------
std::string TrackerEngine::executeCommand(const std::string& request_text) {
  json request;
  try {
    request = json::parse(request_text);
  } catch (const json::parse_error& e) {
    return errorReply("malformed", std::string("request is not JSON: ") +
                                       e.what())
        .dump();
  }
  if (!request.is_object() || !request.contains("action") ||
      !request.at("action").is_string()) {
    return errorReply("malformed", "request needs a string 'action'").dump();
  }

  const std::string action = request.at("action").get<std::string>();
  const int offset = settings_.market.utc_offset_minutes;
  json response{{"status", "ok"}};

  try {
    if (action == "ping") {
      response["response"] = "pong";
    } else if (action == "status") {
      response["engine"] = codec::toJson(status());
    } else if (action == "list_strategies") {
      json list = json::array();
      for (const auto& snapshot : manager_->list()) {
        list.push_back(codec::toJson(snapshot, offset));
      }
      response["strategies"] = std::move(list);
    } else if (action == "get_strategy") {
      auto snapshot = manager_->snapshot(idField(request));
      if (!snapshot) {
        return errorReply("not_found", "no such strategy").dump();
      }
      response["strategy"] = codec::toJson(*snapshot, offset);
    } else if (action == "create_strategy") {
      auto config = codec::configFromJson(request.at("config"),
                                          settings_.strategy_defaults);
      const auto id = manager_->create(config);
      response["strategy_id"] = id;
      if (auto snapshot = manager_->snapshot(id)) {
        response["strategy"] = codec::toJson(*snapshot, offset);
      }
    } else if (action == "update_strategy") {
      const auto id = idField(request);
      auto outcome =
          manager_->update(id, codec::updateFromJson(request.at("changes")));
      if (outcome != UpdateOutcome::Ok) {
        return errorReply(updateOutcomeToString(outcome),
                          "strategy " + std::to_string(id) + " not updated")
            .dump();
      }
      if (auto snapshot = manager_->snapshot(id)) {
        response["strategy"] = codec::toJson(*snapshot, offset);
      }
    } else if (action == "remove_strategy") {
      if (!manager_->remove(idField(request))) {
        return errorReply("not_found", "no such strategy").dump();
      }
    } else if (action == "get_preview") {
      auto config = codec::configFromJson(request.at("config"),
                                          settings_.strategy_defaults);
      response["preview"] = codec::toJson(manager_->preview(config));
    } else {
      return errorReply("unknown_action", "unknown action: " + action).dump();
    }
  } catch (const ResolutionError& e) {
    return errorReply("resolution", e.what()).dump();
  } catch (const ConfigError& e) {
    return errorReply("invalid", e.what()).dump();
  } catch (const json::exception& e) {
    return errorReply("malformed", e.what()).dump();
  }

  return response.dump();
}

}  // namespace breakout
