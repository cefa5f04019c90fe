#include "breakout/network/market_data_thread.hpp"

#include <iostream>
#include <utility>

namespace breakout {

MarketDataThread::MarketDataThread(SimulationTimeProvider* sim_clock,
                                   TickSink tick_sink, std::string endpoint)
    : sim_clock_(sim_clock),
      tick_sink_(std::move(tick_sink)),
      endpoint_(std::move(endpoint)) {}

MarketDataThread::~MarketDataThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): create gateway and spawn recv thread
// -----------------------------------------------------------------------------
void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ =
      std::make_unique<MarketDataGateway>(sim_clock_, tick_sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] listening on " << endpoint_
              << (sim_clock_ != nullptr ? " (replay clock)" : "") << "\n";
    gateway_->run();
    std::cout << "[MarketDataThread] recv loop exited. received="
              << gateway_->received()
              << " malformed=" << gateway_->malformed() << "\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal gateway and join thread
// -----------------------------------------------------------------------------
void MarketDataThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace breakout
