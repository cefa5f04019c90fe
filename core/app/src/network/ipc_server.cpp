#include "breakout/network/ipc_server.hpp"
#include "breakout/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace breakout {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint, int utc_offset_minutes,
                     std::size_t telemetry_capacity)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)),
      utc_offset_minutes_(utc_offset_minutes),
      telemetry_queue_(telemetry_capacity) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  if (!cmd_endpoint_.empty()) {
    cmd_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
    cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
    cmd_socket_->bind(cmd_endpoint_);
  }
  if (!pub_endpoint_.empty()) {
    pub_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
    pub_socket_->bind(pub_endpoint_);
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD="
            << (cmd_endpoint_.empty() ? "(off)" : cmd_endpoint_)
            << " PUB=" << (pub_endpoint_.empty() ? "(off)" : pub_endpoint_)
            << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  telemetry_queue_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped. commands=" << commands_served_.load()
            << " telemetry_dropped=" << telemetry_dropped_.load() << "\n";
}

// -----------------------------------------------------------------------------
// pushTelemetry(): bounded enqueue from the publish loop
// -----------------------------------------------------------------------------
void IpcServer::pushTelemetry(Event event) {
  if (pub_endpoint_.empty()) {
    return;
  }
  if (telemetry_queue_.push(std::move(event))) {
    telemetry_dropped_.fetch_add(1);
  }
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    if (cmd_socket_) {
      processCommands();
    } else if (auto event = telemetry_queue_.pop_for(
                   std::chrono::milliseconds(kPollTimeoutMs))) {
      // No command socket to pace the loop: wait on the queue instead.
      if (pub_socket_) {
        auto payload = codec::formatTelemetry(*event, utc_offset_minutes_);
        zmq::message_t msg(payload.data(), payload.size());
        pub_socket_->send(msg, zmq::send_flags::dontwait);
      }
    }
  }

  // Final drain: publish any remaining telemetry before shutdown.
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): drain queue and publish JSON on PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    if (!pub_socket_) {
      continue;
    }
    auto payload = codec::formatTelemetry(*event, utc_offset_minutes_);
    zmq::message_t msg(payload.data(), payload.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    // REP must answer every request or the socket wedges.
    std::cerr << "[IpcServer] ERROR: command handler threw: " << e.what()
              << "\n";
    response = nlohmann::json{{"status", "error"}, {"message", e.what()}}
                   .dump();
  }
  commands_served_.fetch_add(1);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace breakout
