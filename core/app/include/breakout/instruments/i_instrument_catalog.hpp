#pragma once

#include "breakout/domain/instrument.hpp"
#include "breakout/time/time_utils.hpp"

#include <vector>

namespace breakout {

// -----------------------------------------------------------------------------
// IInstrumentCatalog: abstract source of listed option contracts
// -----------------------------------------------------------------------------
//
// @brief  Answers two questions for the resolver: which expiries are listed
//         for an index, and what broker id a given contract carries.
//
// @details
// The resolver depends only on this interface so tests can hand it a small
// in-memory catalog and production can load the broker's contract dump. No
// network access happens behind this seam; catalogs are populated before
// the engine starts and are read-only afterwards.
//
// Thread model:
//   Implementations must be safe for concurrent const calls.
// -----------------------------------------------------------------------------
class IInstrumentCatalog {
 public:
  virtual ~IInstrumentCatalog() = default;

  // -------------------------------------------------------------------------
  // expiries(index)
  // -------------------------------------------------------------------------
  // @return Every listed expiry for the index, ascending, without
  //         duplicates. Empty when nothing is listed.
  // -------------------------------------------------------------------------
  virtual std::vector<TradingDate> expiries(domain::IndexName index) const = 0;

  // -------------------------------------------------------------------------
  // lookup(key)
  // -------------------------------------------------------------------------
  // @return The listed instrument for (index, expiry, strike, type).
  // @throws NotFoundError when the contract is not listed.
  // -------------------------------------------------------------------------
  virtual domain::Instrument lookup(const domain::InstrumentKey& key) const = 0;
};

}  // namespace breakout
