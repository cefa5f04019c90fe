#include "breakout/instruments/instrument_resolver.hpp"
#include "breakout/domain/errors.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace breakout {

InstrumentResolver::InstrumentResolver(const IInstrumentCatalog& catalog,
                                       ResolverConfig config)
    : catalog_(catalog), config_(std::move(config)) {}

// -----------------------------------------------------------------------------
// strikeStep()
// -----------------------------------------------------------------------------
int InstrumentResolver::strikeStep(domain::IndexName index) const {
  auto it = config_.strike_steps.find(index);
  if (it != config_.strike_steps.end() && it->second > 0) {
    return it->second;
  }
  return domain::defaultStrikeStep(index);
}

int InstrumentResolver::strikesPerSide(domain::IndexName index) const {
  auto it = config_.strikes_per_index.find(index);
  if (it != config_.strikes_per_index.end() && it->second >= 0) {
    return it->second;
  }
  return config_.strikes_per_side;
}

// -----------------------------------------------------------------------------
// atmStrike(): std::nearbyint uses the default round-half-to-even mode.
// -----------------------------------------------------------------------------
int InstrumentResolver::atmStrike(domain::IndexName index,
                                  double spot_price) const {
  const int step = strikeStep(index);
  return static_cast<int>(std::nearbyint(spot_price / step)) * step;
}

// -----------------------------------------------------------------------------
// nearestExpiry()
// -----------------------------------------------------------------------------
std::optional<TradingDate> InstrumentResolver::nearestExpiry(
    domain::IndexName index, std::int64_t as_of_ms) const {
  // catalog_.expiries() is ascending: the first unexpired one is nearest.
  for (const auto& expiry : catalog_.expiries(index)) {
    const std::int64_t close_ms = session_time_ms(
        expiry, config_.market_close_minutes, config_.utc_offset_minutes);
    if (as_of_ms < close_ms) {
      return expiry;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// resolve()
// -----------------------------------------------------------------------------
std::vector<domain::Instrument> InstrumentResolver::resolve(
    domain::IndexName index, double spot_price, std::int64_t as_of_ms) const {
  if (!(spot_price > 0.0)) {
    std::ostringstream msg;
    msg << "spot price must be positive for "
        << domain::indexToString(index) << ", got " << spot_price;
    throw ResolutionError(msg.str());
  }

  auto expiry = nearestExpiry(index, as_of_ms);
  if (!expiry) {
    throw ResolutionError(std::string("no unexpired expiry listed for ") +
                          domain::indexToString(index));
  }

  const int step = strikeStep(index);
  const int atm = atmStrike(index, spot_price);
  const int per_side = strikesPerSide(index);

  std::vector<domain::Instrument> out;
  out.reserve(static_cast<std::size_t>(2 * (per_side + 1)));

  auto append = [&](domain::OptionType type, int direction) {
    for (int i = 0; i <= per_side; ++i) {
      domain::InstrumentKey key{index, *expiry, atm + direction * i * step,
                                type};
      try {
        out.push_back(catalog_.lookup(key));
      } catch (const NotFoundError&) {
        // Unlisted strike: skip it, keep the rest of the ladder.
      }
    }
  };
  append(domain::OptionType::Call, +1);
  append(domain::OptionType::Put, -1);

  if (out.empty()) {
    std::ostringstream msg;
    msg << "no listed strikes around ATM " << atm << " for "
        << domain::indexToString(index) << " expiry "
        << format_date(*expiry);
    throw ResolutionError(msg.str());
  }
  return out;
}

}  // namespace breakout
