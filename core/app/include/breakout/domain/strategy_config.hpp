#pragma once

#include "breakout/domain/instrument.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace breakout {
namespace domain {

// -----------------------------------------------------------------------------
// StrategyId
// -----------------------------------------------------------------------------
// Unique id of a strategy within one engine lifetime (and across restarts:
// the checkpoint stores the next id). 0 is reserved as "unset".
// -----------------------------------------------------------------------------
using StrategyId = std::uint64_t;

// -----------------------------------------------------------------------------
// OptionFilter
// -----------------------------------------------------------------------------
// Which option types a strategy considers as candidates.
// -----------------------------------------------------------------------------
enum class OptionFilter {
  Both,
  CallsOnly,
  PutsOnly,
};

// -----------------------------------------------------------------------------
// EntryPriceSource
// -----------------------------------------------------------------------------
// What becomes entry_price at the MONITORING transition: the selected
// instrument's last traded price at the entry instant, or its lookback low.
// Engine-wide setting (Settings::strategy.entry_price_source).
// -----------------------------------------------------------------------------
enum class EntryPriceSource {
  LastPrice,
  LookbackLow,
};

// -----------------------------------------------------------------------------
// StrategyConfig
// -----------------------------------------------------------------------------
// Responsibility: The user-supplied parameters of one strategy, exactly as
// entered on the control surface (times are exchange-local minutes of day).
//
// @details
// spot_price is optional: when present the resolver uses it, otherwise the
// strategy manager falls back to the last spot observed on the tick stream.
// It is an input to resolution only and is not persisted.
//
// Value type; validated by StrategyManager::validate() before use.
// -----------------------------------------------------------------------------
struct StrategyConfig {
  IndexName index{IndexName::Nifty};
  int entry_minutes{11 * 60};        // Minutes since local midnight
  int lookback_minutes{60};
  double target_premium{50.0};
  double stop_loss_percent{50.0};
  OptionFilter option_filter{OptionFilter::Both};
  std::optional<double> spot_price;
};

// -----------------------------------------------------------------------------
// StrategyUpdate
// -----------------------------------------------------------------------------
// Partial edit of a live strategy. Unset fields are left untouched. Target
// premium and stop loss may change while Pending or Lookback; entry time and
// lookback length only while Pending.
// -----------------------------------------------------------------------------
struct StrategyUpdate {
  std::optional<int> entry_minutes;
  std::optional<int> lookback_minutes;
  std::optional<double> target_premium;
  std::optional<double> stop_loss_percent;
};

inline bool accepts(OptionFilter filter, OptionType type) {
  switch (filter) {
    case OptionFilter::Both:      return true;
    case OptionFilter::CallsOnly: return type == OptionType::Call;
    case OptionFilter::PutsOnly:  return type == OptionType::Put;
  }
  return true;
}

const char* optionFilterToString(OptionFilter filter);
std::optional<OptionFilter> parseOptionFilter(const std::string& text);

const char* entryPriceSourceToString(EntryPriceSource source);
std::optional<EntryPriceSource> parseEntryPriceSource(const std::string& text);

}  // namespace domain
}  // namespace breakout
