#pragma once

#include "breakout/concurrent/thread_safe_queue.hpp"
#include "breakout/domain/tick.hpp"
#include "breakout/events/event_types.hpp"
#include "breakout/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace breakout {

// -----------------------------------------------------------------------------
// TickIngestorConfig
// -----------------------------------------------------------------------------
struct TickIngestorConfig {
  std::size_t partitions{4};
  std::size_t queue_capacity{10'000};  // Per partition
};

// -----------------------------------------------------------------------------
// TickIngestor
// -----------------------------------------------------------------------------
//
// @brief  Accepts decoded ticks from the transport thread and fans them out
//         to subscribers on a fixed pool of partition workers.
//
// @details
// ingest() never blocks on subscribers: it stamps the tick (receipt time,
// sequence id), hashes the instrument id to a partition and enqueues.
// Each partition has exactly one worker draining it in FIFO order, so ticks
// for one instrument are delivered in ingest order and never concurrently.
//
// Backpressure:
//   A full partition evicts the oldest queued tick for the SAME instrument
//   (only the newest price per instrument matters to the trackers), or the
//   oldest tick in the partition when none for that instrument is queued.
//   Every eviction increments the total and per-instrument drop counters and
//   invokes the drop callback with a TickDroppedEvent. No tick disappears
//   without a counter moving.
//
// Fault isolation:
//   A subscriber that throws a std::exception is logged and counted; the
//   worker continues with the next subscriber and the next tick.
//
// Thread model:
//   subscribe()/onDrop() must be called before start(). ingest() is safe
//   from any thread. Subscribers run on partition worker threads; one
//   instrument always maps to the same worker.
//
// Ownership:
//   Owned by TrackerEngine via std::unique_ptr. Holds a reference to the
//   clock, which must outlive it.
// -----------------------------------------------------------------------------
class TickIngestor {
 public:
  using Subscriber = std::function<void(const domain::Tick&)>;
  using DropCallback = std::function<void(const TickDroppedEvent&)>;

  TickIngestor(const ITimeProvider& clock, TickIngestorConfig config);
  ~TickIngestor();

  TickIngestor(const TickIngestor&) = delete;
  TickIngestor& operator=(const TickIngestor&) = delete;
  TickIngestor(TickIngestor&&) = delete;
  TickIngestor& operator=(TickIngestor&&) = delete;

  void subscribe(Subscriber subscriber);
  void onDrop(DropCallback callback);

  // Spawns one worker per partition. Idempotent.
  void start();

  // Delivers what is still queued, then joins every worker. Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // ingest(tick)
  // -------------------------------------------------------------------------
  // @brief  Bounded-time enqueue. Returns immediately.
  //
  // @details
  // Overwrites receipt_ts_ms with the clock and assigns sequence_id. Ticks
  // ingested before start() are queued and delivered once workers run.
  // Ticks ingested after stop() are counted as dropped.
  // -------------------------------------------------------------------------
  void ingest(domain::Tick tick);

  // -------------------------------------------------------------------------
  // waitIdle(timeout)
  // -------------------------------------------------------------------------
  // @brief  Blocks until every ingested tick has been delivered or dropped.
  // @return false on timeout.
  // -------------------------------------------------------------------------
  bool waitIdle(std::chrono::milliseconds timeout) const;

  std::uint64_t ingested() const { return ingested_.load(); }
  std::uint64_t processed() const { return processed_.load(); }
  std::uint64_t dropped() const { return dropped_.load(); }
  std::uint64_t handlerErrors() const { return handler_errors_.load(); }
  std::uint64_t droppedFor(const std::string& instrument_id) const;

  std::size_t partitionCount() const { return partitions_.size(); }
  std::size_t partitionFor(const std::string& instrument_id) const;

 private:
  struct Partition {
    explicit Partition(std::size_t capacity) : queue(capacity) {}
    ThreadSafeQueue<domain::Tick> queue;
    std::thread worker;
  };

  void workerLoop(Partition& partition);
  void deliver(const domain::Tick& tick);
  void recordDrop(const domain::Tick& evicted);

  const ITimeProvider& clock_;
  TickIngestorConfig config_;

  std::vector<std::unique_ptr<Partition>> partitions_;
  std::vector<Subscriber> subscribers_;
  DropCallback on_drop_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};  // stop() ran; set until the next start()
  std::atomic<std::uint64_t> next_sequence_{1};
  std::atomic<std::uint64_t> ingested_{0};
  std::atomic<std::uint64_t> processed_{0};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::uint64_t> handler_errors_{0};

  mutable std::mutex drop_mutex_;  // Protects dropped_by_instrument_
  std::unordered_map<std::string, std::uint64_t> dropped_by_instrument_;
};

}  // namespace breakout
