#include "breakout/domain/strategy_config.hpp"

namespace breakout {
namespace domain {

const char* optionFilterToString(OptionFilter filter) {
  switch (filter) {
    case OptionFilter::Both:      return "both";
    case OptionFilter::CallsOnly: return "CE";
    case OptionFilter::PutsOnly:  return "PE";
  }
  return "both";
}

std::optional<OptionFilter> parseOptionFilter(const std::string& text) {
  if (text == "both" || text == "BOTH" || text.empty()) {
    return OptionFilter::Both;
  }
  if (auto type = parseOptionType(text)) {
    return *type == OptionType::Call ? OptionFilter::CallsOnly
                                     : OptionFilter::PutsOnly;
  }
  return std::nullopt;
}

const char* entryPriceSourceToString(EntryPriceSource source) {
  switch (source) {
    case EntryPriceSource::LastPrice:   return "last_price";
    case EntryPriceSource::LookbackLow: return "lookback_low";
  }
  return "last_price";
}

std::optional<EntryPriceSource> parseEntryPriceSource(const std::string& text) {
  if (text == "last_price") return EntryPriceSource::LastPrice;
  if (text == "lookback_low") return EntryPriceSource::LookbackLow;
  return std::nullopt;
}

}  // namespace domain
}  // namespace breakout
