#include "breakout/instruments/instrument_catalog.hpp"
#include "breakout/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

namespace breakout {

namespace {

constexpr const char* kMonthAbbrev[12] = {"JAN", "FEB", "MAR", "APR",
                                          "MAY", "JUN", "JUL", "AUG",
                                          "SEP", "OCT", "NOV", "DEC"};

}  // namespace

// -----------------------------------------------------------------------------
// expiries()
// -----------------------------------------------------------------------------
std::vector<TradingDate> InstrumentCatalog::expiries(
    domain::IndexName index) const {
  auto it = expiries_.find(index);
  if (it == expiries_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

// -----------------------------------------------------------------------------
// lookup()
// -----------------------------------------------------------------------------
domain::Instrument InstrumentCatalog::lookup(
    const domain::InstrumentKey& key) const {
  auto it = contracts_.find(key);
  if (it == contracts_.end()) {
    throw NotFoundError("contract not listed: " + domain::describe(key));
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// addContract()
// -----------------------------------------------------------------------------
void InstrumentCatalog::addContract(const domain::Instrument& instrument) {
  contracts_[instrument.key] = instrument;
  expiries_[instrument.key.index].insert(instrument.key.expiry);
}

// -----------------------------------------------------------------------------
// addSeries()
// -----------------------------------------------------------------------------
void InstrumentCatalog::addSeries(domain::IndexName index,
                                  const TradingDate& expiry,
                                  const std::string& option_prefix,
                                  int min_strike, int max_strike, int step) {
  if (step <= 0 || min_strike > max_strike) {
    throw ConfigError("invalid strike series for " +
                      std::string(domain::indexToString(index)));
  }
  for (int strike = min_strike; strike <= max_strike; strike += step) {
    for (auto type : {domain::OptionType::Call, domain::OptionType::Put}) {
      domain::InstrumentKey key{index, expiry, strike, type};
      addContract({formatTradingSymbol(option_prefix, key), key});
    }
  }
}

// -----------------------------------------------------------------------------
// loadFromJson()
// -----------------------------------------------------------------------------
std::size_t InstrumentCatalog::loadFromJson(const nlohmann::json& doc) {
  if (!doc.is_array()) {
    throw ConfigError("contracts document must be a JSON array");
  }

  std::size_t added = 0;
  for (const auto& entry : doc) {
    try {
      const auto index_text = entry.at("index").get<std::string>();
      const auto expiry_text = entry.at("expiry").get<std::string>();
      const auto type_text = entry.at("type").get<std::string>();

      auto index = domain::parseIndex(index_text);
      auto expiry = parse_date(expiry_text);
      auto type = domain::parseOptionType(type_text);
      if (!index || !expiry || !type) {
        throw ConfigError("bad contract entry: " + entry.dump());
      }

      domain::Instrument instrument;
      instrument.id = entry.at("id").get<std::string>();
      instrument.key = {*index, *expiry, entry.at("strike").get<int>(), *type};
      addContract(instrument);
      ++added;
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError(std::string("bad contract entry: ") + e.what());
    }
  }
  return added;
}

// -----------------------------------------------------------------------------
// loadFromFile()
// -----------------------------------------------------------------------------
std::size_t InstrumentCatalog::loadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open contracts file: " + path);
  }

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("contracts file " + path + ": " + e.what());
  }

  std::size_t added = loadFromJson(doc);
  std::cout << "[InstrumentCatalog] loaded " << added << " contract(s) from "
            << path << "\n";
  return added;
}

// -----------------------------------------------------------------------------
// formatTradingSymbol()
// -----------------------------------------------------------------------------
std::string InstrumentCatalog::formatTradingSymbol(
    const std::string& option_prefix, const domain::InstrumentKey& key) {
  const int yy = key.expiry.year % 100;
  std::string id = option_prefix;
  if (yy < 10) {
    id += '0';
  }
  id += std::to_string(yy);
  id += kMonthAbbrev[(key.expiry.month - 1) % 12];
  id += std::to_string(key.strike);
  id += domain::optionTypeToString(key.type);
  return id;
}

}  // namespace breakout
