#include "breakout/persistence/checkpoint_store.hpp"
#include "breakout/codec/json_codec.hpp"
#include "breakout/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <thread>
#include <utility>

namespace breakout {

namespace {
constexpr int kCheckpointVersion = 1;
}  // namespace

CheckpointStore::CheckpointStore(CheckpointConfig config)
    : config_(std::move(config)) {
  if (config_.max_attempts < 1) {
    config_.max_attempts = 1;
  }
}

// -----------------------------------------------------------------------------
// writeOnce(): tmp file, then rename over the live checkpoint
// -----------------------------------------------------------------------------
bool CheckpointStore::writeOnce(const std::string& payload) {
  const std::string tmp = config_.path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      return false;
    }
    out << payload;
    out.flush();
    if (!out) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  if (std::rename(tmp.c_str(), config_.path.c_str()) != 0) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// save(): retry loop with exponential backoff
// -----------------------------------------------------------------------------
bool CheckpointStore::save(const Checkpoint& checkpoint) {
  nlohmann::json doc;
  doc["version"] = kCheckpointVersion;
  doc["written_at_ms"] = checkpoint.written_at_ms;
  doc["next_id"] = checkpoint.next_id;
  doc["strategies"] = nlohmann::json::array();
  for (const auto& record : checkpoint.strategies) {
    doc["strategies"].push_back(codec::toJson(record));
  }
  const std::string payload = doc.dump(2);

  std::lock_guard lock(write_mutex_);
  auto backoff = config_.initial_backoff;
  for (int attempt = 1; attempt <= config_.max_attempts; ++attempt) {
    if (writeOnce(payload)) {
      if (degraded_.exchange(false)) {
        std::cout << "[CheckpointStore] writes to " << config_.path
                  << " recovered\n";
      }
      last_success_ms_.store(checkpoint.written_at_ms);
      return true;
    }
    failed_attempts_.fetch_add(1);
    if (attempt < config_.max_attempts) {
      std::cerr << "[CheckpointStore] WARNING: write to " << config_.path
                << " failed, retry " << attempt << "/"
                << (config_.max_attempts - 1) << " in " << backoff.count()
                << "ms\n";
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }

  if (!degraded_.exchange(true)) {
    std::cerr << "[CheckpointStore] ERROR: checkpoint " << config_.path
              << " not written after " << config_.max_attempts
              << " attempt(s); durability degraded\n";
  }
  return false;
}

// -----------------------------------------------------------------------------
// load()
// -----------------------------------------------------------------------------
std::optional<Checkpoint> CheckpointStore::load() {
  std::ifstream in(config_.path);
  if (!in) {
    std::cout << "[CheckpointStore] no checkpoint at " << config_.path
              << ", starting empty\n";
    return std::nullopt;
  }

  try {
    nlohmann::json doc = nlohmann::json::parse(in);
    Checkpoint checkpoint;
    checkpoint.written_at_ms = doc.value("written_at_ms", std::int64_t{0});
    checkpoint.next_id = doc.value("next_id", domain::StrategyId{1});
    for (const auto& item : doc.at("strategies")) {
      checkpoint.strategies.push_back(codec::recordFromJson(item));
    }
    last_success_ms_.store(checkpoint.written_at_ms);
    std::cout << "[CheckpointStore] loaded " << checkpoint.strategies.size()
              << " strategy(ies) from " << config_.path << "\n";
    return checkpoint;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[CheckpointStore] ERROR: " << config_.path
              << " unreadable: " << e.what() << "\n";
  } catch (const ConfigError& e) {
    std::cerr << "[CheckpointStore] ERROR: " << config_.path
              << " has an invalid strategy: " << e.what() << "\n";
  }

  in.close();
  const std::string aside = config_.path + ".corrupt";
  if (std::rename(config_.path.c_str(), aside.c_str()) == 0) {
    std::cerr << "[CheckpointStore] WARNING: moved to " << aside << "\n";
  }
  return std::nullopt;
}

}  // namespace breakout
