#include "breakout/persistence/tick_archive.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <utility>

namespace breakout {

namespace {

std::string encodeLine(const domain::Tick& tick) {
  nlohmann::json j;
  j["t"] = tick.exchange_ts_ms;
  j["i"] = tick.instrument_id;
  j["p"] = tick.ltp;
  return j.dump();
}

}  // namespace

TickArchive::TickArchive(std::string path, std::size_t buffer_size)
    : path_(std::move(path)),
      buffer_size_(buffer_size == 0 ? 1 : buffer_size),
      buffer_cap_(buffer_size_ * kBufferCapFactor) {}

TickArchive::~TickArchive() {
  std::lock_guard lock(mutex_);
  if (!flushLocked()) {
    std::cerr << "[TickArchive] ERROR: " << buffer_.size()
              << " tick(s) lost at shutdown, " << path_ << " not writable\n";
  }
}

// -----------------------------------------------------------------------------
// append()
// -----------------------------------------------------------------------------
void TickArchive::append(const domain::Tick& tick) {
  std::lock_guard lock(mutex_);
  buffer_.push_back(tick);
  appended_.fetch_add(1);
  if (buffer_.size() > buffer_cap_) {
    buffer_.pop_front();
    const auto dropped = dropped_.fetch_add(1) + 1;
    if (dropped == 1 || dropped % 1000 == 0) {
      std::cerr << "[TickArchive] WARNING: buffer full, " << dropped
                << " oldest tick(s) dropped so far\n";
    }
  }
  // One write attempt per buffer_size appends, also while the file is
  // failing. A failure is already logged and counted; the ticks stay buffered.
  if (++appends_since_attempt_ >= buffer_size_) {
    flushLocked();
  }
}

bool TickArchive::flush() {
  std::lock_guard lock(mutex_);
  return flushLocked();
}

std::size_t TickArchive::buffered() const {
  std::lock_guard lock(mutex_);
  return buffer_.size();
}

// -----------------------------------------------------------------------------
// flushLocked(): caller holds mutex_
// -----------------------------------------------------------------------------
bool TickArchive::flushLocked() {
  appends_since_attempt_ = 0;
  if (buffer_.empty()) {
    return true;
  }
  std::ofstream out(path_, std::ios::app);
  if (out) {
    for (const auto& tick : buffer_) {
      out << encodeLine(tick) << '\n';
    }
    out.flush();
  }
  if (!out) {
    const auto failures = write_failures_.fetch_add(1) + 1;
    if (failures == 1 || failures % 100 == 0) {
      std::cerr << "[TickArchive] WARNING: append to " << path_
                << " failed (" << failures << " failure(s) so far)\n";
    }
    return false;
  }
  buffer_.clear();
  return true;
}

// -----------------------------------------------------------------------------
// readFileLocked(): every parseable line in the file
// -----------------------------------------------------------------------------
std::vector<domain::Tick> TickArchive::readFileLocked() const {
  std::vector<domain::Tick> ticks;
  std::ifstream in(path_);
  if (!in) {
    return ticks;  // Nothing archived yet.
  }
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    try {
      auto j = nlohmann::json::parse(line);
      domain::Tick tick;
      tick.exchange_ts_ms = j.at("t").get<std::int64_t>();
      tick.instrument_id = j.at("i").get<std::string>();
      tick.ltp = j.at("p").get<double>();
      ticks.push_back(std::move(tick));
    } catch (const nlohmann::json::exception&) {
      // Torn last line after a crash, or foreign content: skip it.
    }
  }
  return ticks;
}

// -----------------------------------------------------------------------------
// query()
// -----------------------------------------------------------------------------
std::vector<domain::Tick> TickArchive::query(
    std::int64_t start_ms, std::int64_t end_ms,
    const std::unordered_set<std::string>& instrument_ids) const {
  std::lock_guard lock(mutex_);

  auto matches = [&](const domain::Tick& t) {
    return t.exchange_ts_ms >= start_ms && t.exchange_ts_ms <= end_ms &&
           (instrument_ids.empty() || instrument_ids.count(t.instrument_id));
  };

  std::vector<domain::Tick> out;
  for (auto& tick : readFileLocked()) {
    if (matches(tick)) {
      out.push_back(std::move(tick));
    }
  }
  for (const auto& tick : buffer_) {
    if (matches(tick)) {
      out.push_back(tick);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// prune()
// -----------------------------------------------------------------------------
std::size_t TickArchive::prune(std::int64_t cutoff_ms) {
  std::lock_guard lock(mutex_);

  auto ticks = readFileLocked();
  std::size_t removed = 0;
  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      std::cerr << "[TickArchive] WARNING: cannot write " << tmp
                << ", prune skipped\n";
      return 0;
    }
    for (const auto& tick : ticks) {
      if (tick.exchange_ts_ms < cutoff_ms) {
        ++removed;
        continue;
      }
      out << encodeLine(tick) << '\n';
    }
    out.flush();
    if (!out) {
      std::cerr << "[TickArchive] WARNING: write to " << tmp
                << " failed, prune skipped\n";
      std::remove(tmp.c_str());
      return 0;
    }
  }
  if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
    std::cerr << "[TickArchive] WARNING: rename " << tmp << " -> " << path_
              << " failed, prune skipped\n";
    std::remove(tmp.c_str());
    return 0;
  }

  // Buffered ticks are not in the file yet; drop the stale ones too.
  for (auto it = buffer_.begin(); it != buffer_.end();) {
    if (it->exchange_ts_ms < cutoff_ms) {
      it = buffer_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }

  if (removed > 0) {
    std::cout << "[TickArchive] pruned " << removed << " tick(s) older than "
              << cutoff_ms << "\n";
  }
  return removed;
}

}  // namespace breakout
