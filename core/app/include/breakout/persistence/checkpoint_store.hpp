#pragma once

#include "breakout/domain/strategy_config.hpp"
#include "breakout/strategy/strategy.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace breakout {

struct CheckpointConfig {
  std::string path{"breakout_checkpoint.json"};
  int max_attempts{3};
  std::chrono::milliseconds initial_backoff{100};  // Doubles per retry
};

// Everything needed to rebuild the live set after a restart.
struct Checkpoint {
  std::vector<StrategyRecord> strategies;
  domain::StrategyId next_id{1};
  std::int64_t written_at_ms{0};
};

// -----------------------------------------------------------------------------
// CheckpointStore
// -----------------------------------------------------------------------------
//
// @brief  Writes and reads the strategy checkpoint file.
//
// @details
// Document layout:
//
//   {"version":1, "written_at_ms":..., "next_id":7,
//    "strategies":[ {<StrategyRecord>}, ... ]}
//
// save() serializes to `<path>.tmp` and renames it over `<path>`, so a
// reader (or a crash) sees either the previous checkpoint or the new one,
// never a torn file. A failed attempt is retried up to max_attempts times
// with exponential backoff (initial_backoff, 2x, 4x ...). When every attempt
// fails, save() returns false and degraded() stays true until a later save
// succeeds. Failures never throw.
//
// load() returns std::nullopt when there is no checkpoint. A file that does
// not parse is moved aside to `<path>.corrupt` and also yields nullopt, so
// the engine starts empty rather than refusing to start.
//
// Thread model:
//   save() runs on the checkpoint timer thread; load() at startup. The
//   status accessors are atomics, safe from any thread.
// -----------------------------------------------------------------------------
class CheckpointStore {
 public:
  explicit CheckpointStore(CheckpointConfig config);

  bool save(const Checkpoint& checkpoint);
  std::optional<Checkpoint> load();

  bool degraded() const { return degraded_.load(); }
  std::int64_t lastSuccessMs() const { return last_success_ms_.load(); }
  std::uint64_t failedAttempts() const { return failed_attempts_.load(); }

  const CheckpointConfig& config() const { return config_; }

 private:
  bool writeOnce(const std::string& payload);

  CheckpointConfig config_;
  std::mutex write_mutex_;  // One save() at a time

  std::atomic<bool> degraded_{false};
  std::atomic<std::int64_t> last_success_ms_{0};
  std::atomic<std::uint64_t> failed_attempts_{0};
};

}  // namespace breakout
