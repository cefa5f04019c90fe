#pragma once

#include "breakout/domain/tick.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace breakout {

// -----------------------------------------------------------------------------
// ITickHistory: read side of the tick archive
// -----------------------------------------------------------------------------
// Historical seeding and preview only need to read past ticks; they depend
// on this interface so tests can supply ticks from memory.
// -----------------------------------------------------------------------------
class ITickHistory {
 public:
  virtual ~ITickHistory() = default;

  // -------------------------------------------------------------------------
  // query(start_ms, end_ms, instrument_ids)
  // -------------------------------------------------------------------------
  // @return Ticks with start_ms <= exchange_ts_ms <= end_ms whose instrument
  //         is in `instrument_ids`, in archive (arrival) order. An empty
  //         id set matches every instrument.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::Tick> query(
      std::int64_t start_ms, std::int64_t end_ms,
      const std::unordered_set<std::string>& instrument_ids) const = 0;
};

}  // namespace breakout
