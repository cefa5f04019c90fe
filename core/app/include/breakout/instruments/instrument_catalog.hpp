#pragma once

#include "breakout/instruments/i_instrument_catalog.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <unordered_map>

namespace breakout {

// -----------------------------------------------------------------------------
// InstrumentCatalog: in-memory contract table
// -----------------------------------------------------------------------------
//
// @brief  Concrete IInstrumentCatalog backed by a hash map keyed on the
//         structured InstrumentKey.
//
// @details
// Two ways to populate it:
//
//   1. loadFromJson()/loadFromFile(): a contracts document, an array of
//        { "id": "NSE_FO|52910", "index": "NIFTY", "expiry": "2025-01-30",
//          "strike": 23500, "type": "CE" }
//      exported from the broker's instrument master.
//
//   2. addSeries(): generates a contiguous strike ladder for one expiry with
//      ids in the broker's trading-symbol form
//        <option_prefix><YY><MMM><strike><CE|PE>   e.g. NSE_FO|NIFTY25JAN26100CE
//      Used when no contract dump is available.
//
// A later entry for the same key replaces the earlier one.
//
// Thread model:
//   Populate on one thread before sharing; const methods are then safe to
//   call concurrently (no internal mutation).
// -----------------------------------------------------------------------------
class InstrumentCatalog final : public IInstrumentCatalog {
 public:
  InstrumentCatalog() = default;

  std::vector<TradingDate> expiries(domain::IndexName index) const override;
  domain::Instrument lookup(const domain::InstrumentKey& key) const override;

  // Adds or replaces one contract.
  void addContract(const domain::Instrument& instrument);

  // -------------------------------------------------------------------------
  // addSeries(index, expiry, option_prefix, min_strike, max_strike, step)
  // -------------------------------------------------------------------------
  // @brief  Lists CE and PE contracts for every strike in
  //         [min_strike, max_strike] at `step` for one expiry.
  //
  // @throws ConfigError if step <= 0 or min_strike > max_strike.
  // -------------------------------------------------------------------------
  void addSeries(domain::IndexName index, const TradingDate& expiry,
                 const std::string& option_prefix, int min_strike,
                 int max_strike, int step);

  // -------------------------------------------------------------------------
  // loadFromJson(doc) / loadFromFile(path)
  // -------------------------------------------------------------------------
  // @return Number of contracts added.
  // @throws ConfigError on a malformed document or unreadable file; no
  //         partial load is rolled back, so callers treat this as fatal.
  // -------------------------------------------------------------------------
  std::size_t loadFromJson(const nlohmann::json& doc);
  std::size_t loadFromFile(const std::string& path);

  std::size_t size() const { return contracts_.size(); }

  // Broker trading-symbol id for a contract: prefix + YY + MMM + strike + type.
  static std::string formatTradingSymbol(const std::string& option_prefix,
                                         const domain::InstrumentKey& key);

 private:
  std::unordered_map<domain::InstrumentKey, domain::Instrument,
                     domain::InstrumentKeyHash>
      contracts_;
  std::map<domain::IndexName, std::set<TradingDate>> expiries_;
};

}  // namespace breakout
