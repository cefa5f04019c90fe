#pragma once

#include "breakout/time/time_utils.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <tuple>

namespace breakout {
namespace domain {

// -----------------------------------------------------------------------------
// IndexName
// -----------------------------------------------------------------------------
// Underlying index of an option series. Scoped enum so an index can never be
// confused with a strike or an array position.
// -----------------------------------------------------------------------------
enum class IndexName {
  Nifty,
  BankNifty,
  FinNifty,
  Sensex,
};

// -----------------------------------------------------------------------------
// OptionType
// -----------------------------------------------------------------------------
// CE (call) or PE (put). Rendered as the exchange suffix in ids and JSON.
// -----------------------------------------------------------------------------
enum class OptionType {
  Call,
  Put,
};

// -----------------------------------------------------------------------------
// InstrumentKey
// -----------------------------------------------------------------------------
// Responsibility: Structured identity of one listed option contract:
// (index, expiry, strike, type). Every tracker map is keyed by this struct
// (or a struct containing it), never by a concatenated string, so
// "NIFTY26200CE" and "NIFTY2620 0CE" can never collide and formatting never
// leaks into lookups.
//
// Value type: cheap to copy, totally ordered, hashable.
// -----------------------------------------------------------------------------
struct InstrumentKey {
  IndexName index{IndexName::Nifty};
  TradingDate expiry{};
  int strike{0};
  OptionType type{OptionType::Call};

  friend bool operator==(const InstrumentKey& a, const InstrumentKey& b) {
    return a.index == b.index && a.expiry == b.expiry &&
           a.strike == b.strike && a.type == b.type;
  }
  friend bool operator!=(const InstrumentKey& a, const InstrumentKey& b) {
    return !(a == b);
  }
  friend bool operator<(const InstrumentKey& a, const InstrumentKey& b) {
    return std::tie(a.index, a.expiry.year, a.expiry.month, a.expiry.day,
                    a.strike, a.type) <
           std::tie(b.index, b.expiry.year, b.expiry.month, b.expiry.day,
                    b.strike, b.type);
  }
};

struct InstrumentKeyHash {
  std::size_t operator()(const InstrumentKey& k) const noexcept {
    std::size_t h = std::hash<int>{}(static_cast<int>(k.index));
    auto mix = [&h](std::size_t v) {
      h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    };
    mix(std::hash<int>{}(k.expiry.year * 10000 + k.expiry.month * 100 +
                         k.expiry.day));
    mix(std::hash<int>{}(k.strike));
    mix(std::hash<int>{}(static_cast<int>(k.type)));
    return h;
  }
};

// -----------------------------------------------------------------------------
// Instrument
// -----------------------------------------------------------------------------
// Responsibility: A resolved, tradable contract: the broker's canonical
// instrument id (what ticks carry, e.g. "NSE_FO|52910") plus the structured
// key it belongs to. Immutable once produced by the InstrumentResolver.
// -----------------------------------------------------------------------------
struct Instrument {
  std::string id;
  InstrumentKey key;

  friend bool operator==(const Instrument& a, const Instrument& b) {
    return a.id == b.id && a.key == b.key;
  }
  friend bool operator!=(const Instrument& a, const Instrument& b) {
    return !(a == b);
  }
};

// String conversions used by configuration, the checkpoint and telemetry.
const char* indexToString(IndexName index);
std::optional<IndexName> parseIndex(const std::string& text);

const char* optionTypeToString(OptionType type);
std::optional<OptionType> parseOptionType(const std::string& text);

// Exchange strike spacing (NIFTY/FINNIFTY 50, BANKNIFTY/SENSEX 100).
int defaultStrikeStep(IndexName index);

// Human-readable "NIFTY 2026-10-20 26200CE", for log lines only.
std::string describe(const InstrumentKey& key);

}  // namespace domain
}  // namespace breakout
