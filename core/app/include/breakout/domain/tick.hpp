#pragma once

#include <cstdint>
#include <string>

namespace breakout {
namespace domain {

// -----------------------------------------------------------------------------
// Tick
// -----------------------------------------------------------------------------
// Responsibility: One decoded market update from the broker stream: the
// instrument's last traded price at an exchange timestamp.
//
// @details
// Produced by the transport adapter (MarketDataGateway) or by tests, handed
// to TickIngestor::ingest() and delivered by value to subscribers. Never
// mutated after construction. receipt_ts_ms is stamped by the ingestor when
// the transport did not set it, so queueing latency can be measured.
//
// The same Tick type carries index spot updates: the strategy manager treats
// a tick whose instrument_id is a configured spot instrument as a spot
// price rather than an option price.
// -----------------------------------------------------------------------------
struct Tick {
  std::string instrument_id;        // Canonical broker id, e.g. "NSE_FO|52910"
  double ltp{0.0};                  // Last traded price
  std::int64_t exchange_ts_ms{0};   // Exchange timestamp (epoch ms)
  std::int64_t receipt_ts_ms{0};    // When the ingestor accepted it
  std::uint64_t sequence_id{0};     // Ingest order, assigned by the ingestor
};

}  // namespace domain
}  // namespace breakout
