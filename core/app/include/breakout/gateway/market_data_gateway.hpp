#pragma once

#include "breakout/domain/tick.hpp"
#include "breakout/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace breakout {

// -----------------------------------------------------------------------------
// MarketDataGateway: ZeroMQ bridge for the broker tick stream
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded ticks and hands
//         each decoded Tick to the ingestor.
//
// @details
// The broker feed adapter (out of process: it owns the websocket session
// and the protobuf decoding) republishes every LTP update as JSON:
//
//   {"instrument_key":"NSE_FO|52910", "ltp":48.75,
//    "timestamp_ms":1737350400000}
//
// or a JSON array of such objects for a batched feed frame.
//
// When constructed with a SimulationTimeProvider (replay mode) the gateway
// advances the clock to each tick's timestamp BEFORE handing the tick on,
// so every component processing the tick sees the tick's time as "now".
//
// Malformed payloads are logged and skipped; they never stop the loop.
//
// Thread model:
//   run() blocks the calling thread (MarketDataThread's). stop() may be
//   called from any thread; the recv loop notices it within kRecvTimeoutMs.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t (RAII).
//   Holds an optional pointer to the simulation clock (owned by main()).
//   Holds a copy of the tick sink callback.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using TickSink = std::function<void(domain::Tick)>;

  // @param  sim_clock  Advanced per tick when non-null (replay mode).
  // @param  tick_sink  Typically bound to TickIngestor::ingest().
  MarketDataGateway(SimulationTimeProvider* sim_clock, TickSink tick_sink,
                    const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  void run();
  void stop();

  // -------------------------------------------------------------------------
  // parseTicks(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes one message (object or array of objects).
  //
  // @throws nlohmann::json::exception on malformed JSON or missing fields.
  // -------------------------------------------------------------------------
  static std::vector<domain::Tick> parseTicks(const std::string& payload);

  std::uint64_t received() const { return received_.load(); }
  std::uint64_t malformed() const { return malformed_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  void deliver(const std::string& payload);

  SimulationTimeProvider* sim_clock_;
  TickSink tick_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  // Set in the constructor so a stop() issued before run() starts wins.
  std::atomic<bool> running_{true};

  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> malformed_{0};
};

}  // namespace breakout
