#include "breakout/ingest/tick_ingestor.hpp"

#include <exception>
#include <functional>
#include <iostream>
#include <utility>

namespace breakout {

namespace {

// Upper bound on how long a worker sleeps in pop_for() before re-checking
// running_.
constexpr auto kWorkerPollTimeout = std::chrono::milliseconds(20);

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TickIngestor::TickIngestor(const ITimeProvider& clock,
                           TickIngestorConfig config)
    : clock_(clock), config_(config) {
  if (config_.partitions == 0) {
    config_.partitions = 1;
  }
  partitions_.reserve(config_.partitions);
  for (std::size_t i = 0; i < config_.partitions; ++i) {
    partitions_.push_back(std::make_unique<Partition>(config_.queue_capacity));
  }
}

TickIngestor::~TickIngestor() { stop(); }

void TickIngestor::subscribe(Subscriber subscriber) {
  subscribers_.push_back(std::move(subscriber));
}

void TickIngestor::onDrop(DropCallback callback) {
  on_drop_ = std::move(callback);
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TickIngestor::start() {
  if (running_.exchange(true)) {
    return;
  }
  stopped_.store(false);
  for (auto& partition : partitions_) {
    Partition* p = partition.get();
    p->worker = std::thread([this, p] { workerLoop(*p); });
  }
  std::cout << "[TickIngestor] started " << partitions_.size()
            << " partition worker(s), capacity " << config_.queue_capacity
            << " each.\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TickIngestor::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  stopped_.store(true);
  for (auto& partition : partitions_) {
    partition->queue.notify_all();
  }
  for (auto& partition : partitions_) {
    if (partition->worker.joinable()) {
      partition->worker.join();
    }
  }
  std::cout << "[TickIngestor] stopped. ingested=" << ingested()
            << " processed=" << processed() << " dropped=" << dropped()
            << "\n";
}

// -----------------------------------------------------------------------------
// ingest()
// -----------------------------------------------------------------------------
void TickIngestor::ingest(domain::Tick tick) {
  tick.receipt_ts_ms = clock_.now_ms();
  tick.sequence_id = next_sequence_.fetch_add(1);
  ingested_.fetch_add(1);

  if (stopped_.load()) {
    // No worker will run again: count it as dropped instead of queueing it.
    recordDrop(tick);
    return;
  }

  const std::string id = tick.instrument_id;
  Partition& partition = *partitions_[partitionFor(id)];
  auto evicted = partition.queue.push_evicting(
      std::move(tick),
      [&id](const domain::Tick& queued) { return queued.instrument_id == id; });

  if (evicted) {
    recordDrop(*evicted);
  }
}

// -----------------------------------------------------------------------------
// waitIdle()
// -----------------------------------------------------------------------------
bool TickIngestor::waitIdle(std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (processed_.load() + dropped_.load() < ingested_.load()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

std::uint64_t TickIngestor::droppedFor(const std::string& instrument_id) const {
  std::lock_guard lock(drop_mutex_);
  auto it = dropped_by_instrument_.find(instrument_id);
  return it == dropped_by_instrument_.end() ? 0 : it->second;
}

std::size_t TickIngestor::partitionFor(const std::string& instrument_id) const {
  return std::hash<std::string>{}(instrument_id) % partitions_.size();
}

// -----------------------------------------------------------------------------
// workerLoop(): one per partition
// -----------------------------------------------------------------------------
void TickIngestor::workerLoop(Partition& partition) {
  while (running_.load()) {
    auto tick = partition.queue.pop_for(kWorkerPollTimeout);
    if (tick) {
      deliver(*tick);
    }
  }
  // Drain what was accepted before stop().
  while (auto tick = partition.queue.try_pop()) {
    deliver(*tick);
  }
}

// -----------------------------------------------------------------------------
// deliver(): fan out to subscribers with per-subscriber isolation
// -----------------------------------------------------------------------------
void TickIngestor::deliver(const domain::Tick& tick) {
  for (const auto& subscriber : subscribers_) {
    try {
      subscriber(tick);
    } catch (const std::exception& e) {
      handler_errors_.fetch_add(1);
      std::cerr << "[TickIngestor] ERROR: subscriber failed on "
                << tick.instrument_id << " seq=" << tick.sequence_id << ": "
                << e.what() << "\n";
    }
  }
  processed_.fetch_add(1);
}

// -----------------------------------------------------------------------------
// recordDrop()
// -----------------------------------------------------------------------------
void TickIngestor::recordDrop(const domain::Tick& evicted) {
  const std::uint64_t total = dropped_.fetch_add(1) + 1;
  std::uint64_t for_instrument = 0;
  {
    std::lock_guard lock(drop_mutex_);
    for_instrument = ++dropped_by_instrument_[evicted.instrument_id];
  }

  if (total == 1 || total % 1000 == 0) {
    std::cerr << "[TickIngestor] WARNING: partition full, dropped " << total
              << " tick(s) so far (latest " << evicted.instrument_id << ")\n";
  }

  if (on_drop_) {
    TickDroppedEvent event;
    event.instrument_id = evicted.instrument_id;
    event.instrument_dropped = for_instrument;
    event.total_dropped = total;
    event.timestamp_ms = clock_.now_ms();
    try {
      on_drop_(event);
    } catch (const std::exception& e) {
      std::cerr << "[TickIngestor] ERROR: drop callback threw: " << e.what()
                << "\n";
    }
  }
}

}  // namespace breakout
