#pragma once

#include "breakout/persistence/i_tick_history.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace breakout {

// -----------------------------------------------------------------------------
// TickArchive
// -----------------------------------------------------------------------------
//
// @brief  Append-only JSON-lines record of every ingested tick.
//
// @details
// One line per tick, compact keys so a trading day stays small:
//
//   {"t":1737350400000,"i":"NSE_FO|NIFTY25JAN26200CE","p":48.75}
//
// Appends go to an in-memory buffer that is written to the file once it
// holds `buffer_size` ticks, on flush(), and on destruction. query() reads
// the file and the unflushed buffer, so callers always see every tick
// appended so far.
//
// prune(cutoff) rewrites the file without ticks older than the cutoff
// (temporary file, then rename, so a crash mid-prune leaves the old file).
//
// I/O failures never throw out of append()/flush(): they are logged and
// counted in writeFailures(), and the unwritten ticks stay buffered for the
// next attempt. The buffer holds at most 10 x buffer_size ticks; beyond that
// the oldest are dropped and counted in droppedTicks(). Unparseable lines are
// skipped by query().
//
// Thread model:
//   All public methods are safe from any thread (one internal mutex).
//   append() is called from the ingest partition workers.
// -----------------------------------------------------------------------------
class TickArchive final : public ITickHistory {
 public:
  explicit TickArchive(std::string path, std::size_t buffer_size = 100);
  ~TickArchive() override;

  TickArchive(const TickArchive&) = delete;
  TickArchive& operator=(const TickArchive&) = delete;

  void append(const domain::Tick& tick);

  // Writes buffered ticks. Returns false if the write failed.
  bool flush();

  std::vector<domain::Tick> query(
      std::int64_t start_ms, std::int64_t end_ms,
      const std::unordered_set<std::string>& instrument_ids) const override;

  // Removes ticks with exchange time < cutoff_ms. Returns how many went.
  std::size_t prune(std::int64_t cutoff_ms);

  const std::string& path() const { return path_; }
  std::uint64_t appended() const { return appended_.load(); }
  std::uint64_t writeFailures() const { return write_failures_.load(); }
  std::uint64_t droppedTicks() const { return dropped_.load(); }
  std::size_t buffered() const;

 private:
  bool flushLocked();
  std::vector<domain::Tick> readFileLocked() const;

  static constexpr std::size_t kBufferCapFactor = 10;

  std::string path_;
  std::size_t buffer_size_;
  std::size_t buffer_cap_;

  mutable std::mutex mutex_;  // Protects buffer_, the counter below and the file
  std::deque<domain::Tick> buffer_;
  std::size_t appends_since_attempt_{0};

  std::atomic<std::uint64_t> appended_{0};
  std::atomic<std::uint64_t> write_failures_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace breakout
