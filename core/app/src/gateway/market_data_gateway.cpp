#include "breakout/gateway/market_data_gateway.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <string>
#include <utility>

namespace breakout {

namespace {

domain::Tick tickFromJson(const nlohmann::json& j) {
  domain::Tick tick;
  tick.instrument_id = j.at("instrument_key").get<std::string>();
  tick.ltp = j.at("ltp").get<double>();
  tick.exchange_ts_ms = j.at("timestamp_ms").get<std::int64_t>();
  return tick;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: create ZMQ SUB socket with receive timeout
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(SimulationTimeProvider* sim_clock,
                                     TickSink tick_sink,
                                     const std::string& endpoint)
    : sim_clock_(sim_clock), tick_sink_(std::move(tick_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");

  // Without a receive timeout recv() blocks forever and stop() is never
  // observed.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// parseTicks()
// -----------------------------------------------------------------------------
std::vector<domain::Tick> MarketDataGateway::parseTicks(
    const std::string& payload) {
  auto json = nlohmann::json::parse(payload);
  std::vector<domain::Tick> ticks;
  if (json.is_array()) {
    ticks.reserve(json.size());
    for (const auto& item : json) {
      ticks.push_back(tickFromJson(item));
    }
  } else {
    ticks.push_back(tickFromJson(json));
  }
  return ticks;
}

// -----------------------------------------------------------------------------
// deliver(): decode, advance the replay clock, hand to the sink
// -----------------------------------------------------------------------------
void MarketDataGateway::deliver(const std::string& payload) {
  std::vector<domain::Tick> ticks;
  try {
    ticks = parseTicks(payload);
  } catch (const nlohmann::json::exception& e) {
    const auto n = malformed_.fetch_add(1) + 1;
    if (n == 1 || n % 100 == 0) {
      std::cerr << "[MarketDataGateway] WARNING: malformed tick (" << n
                << " so far): " << e.what() << " payload: " << payload
                << "\n";
    }
    return;
  }

  for (auto& tick : ticks) {
    if (sim_clock_ != nullptr) {
      sim_clock_->advance_time(tick.exchange_ts_ms);
    }
    received_.fetch_add(1);
    tick_sink_(std::move(tick));
  }
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop: call from a dedicated thread
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[MarketDataGateway] ERROR: recv failed: " << e.what()
                << "\n";
      break;
    }

    if (!result.has_value()) {
      continue;  // Timeout: re-check running_.
    }
    deliver(msg.to_string());
  }
}

void MarketDataGateway::stop() { running_.store(false); }

}  // namespace breakout
