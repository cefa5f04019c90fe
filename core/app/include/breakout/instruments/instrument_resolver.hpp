#pragma once

#include "breakout/domain/instrument.hpp"
#include "breakout/instruments/i_instrument_catalog.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace breakout {

// -----------------------------------------------------------------------------
// ResolverConfig
// -----------------------------------------------------------------------------
struct ResolverConfig {
  int strikes_per_side{15};           // ATM plus this many strikes each way
  int utc_offset_minutes{330};        // Exchange local time (IST)
  int market_close_minutes{15 * 60 + 30};
  // Per-index override of domain::defaultStrikeStep().
  std::map<domain::IndexName, int> strike_steps;
  // Per-index override of strikes_per_side.
  std::map<domain::IndexName, int> strikes_per_index;
};

// -----------------------------------------------------------------------------
// InstrumentResolver
// -----------------------------------------------------------------------------
//
// @brief  (index, spot price, as-of time) → ordered candidate instruments.
//
// @details
// Candidate order, which is also the selection tie-break order:
//
//   CE: ATM, ATM+step, ..., ATM+N*step
//   PE: ATM, ATM-step, ..., ATM-N*step
//
// with N = strikes_per_side (so up to 2*(N+1) instruments), all on the
// nearest unexpired expiry. ATM is the spot rounded to the nearest strike
// step, halves to even. Strikes the catalog does not list are skipped.
//
// An expiry counts as unexpired while as_of is before market close on the
// expiry day, so on expiry day itself the session's contracts are still
// resolved.
//
// Pure: the result depends only on the arguments and the catalog contents.
// Never reads live ticks or the clock.
//
// @throws ResolutionError when spot <= 0, when the index has no unexpired
//         expiry, or when no strike in range is listed.
//
// Thread model: const and stateless; safe from any thread.
// -----------------------------------------------------------------------------
class InstrumentResolver {
 public:
  InstrumentResolver(const IInstrumentCatalog& catalog, ResolverConfig config);

  std::vector<domain::Instrument> resolve(domain::IndexName index,
                                          double spot_price,
                                          std::int64_t as_of_ms) const;

  int strikeStep(domain::IndexName index) const;
  int strikesPerSide(domain::IndexName index) const;

  // Spot rounded to the nearest strike step (half to even).
  int atmStrike(domain::IndexName index, double spot_price) const;

  // Nearest expiry still tradable at as_of, or nullopt.
  std::optional<TradingDate> nearestExpiry(domain::IndexName index,
                                           std::int64_t as_of_ms) const;

  const ResolverConfig& config() const { return config_; }

 private:
  const IInstrumentCatalog& catalog_;
  ResolverConfig config_;
};

}  // namespace breakout
