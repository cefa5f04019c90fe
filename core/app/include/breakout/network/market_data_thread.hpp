#pragma once

#include "breakout/gateway/market_data_gateway.hpp"
#include "breakout/time/simulation_time_provider.hpp"

#include <memory>
#include <string>
#include <thread>

namespace breakout {

// -----------------------------------------------------------------------------
// MarketDataThread: dedicated I/O thread for the tick stream
// -----------------------------------------------------------------------------
//
// @brief  Owns a MarketDataGateway and the std::thread running its recv
//         loop, so network I/O never runs on an ingest worker.
//
// @details
// The gateway is created in start(), not in the constructor, so the engine
// can build the whole component graph before any socket connects.
//
// Thread model:
//   start()/stop() from the owning thread (main, via TrackerEngine).
//   The internal thread runs MarketDataGateway::run() exclusively.
//
// Ownership:
//   Owned by TrackerEngine via std::unique_ptr.
//   Owns the MarketDataGateway via std::unique_ptr.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  using TickSink = MarketDataGateway::TickSink;

  MarketDataThread(SimulationTimeProvider* sim_clock, TickSink tick_sink,
                   std::string endpoint = "tcp://127.0.0.1:5555");

  // RAII: calls stop().
  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  // Idempotent.
  void start();
  // Idempotent; blocks until the recv loop has exited.
  void stop();

 private:
  SimulationTimeProvider* sim_clock_;
  TickSink tick_sink_;
  std::string endpoint_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace breakout
