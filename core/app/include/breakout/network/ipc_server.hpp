#pragma once

#include "breakout/concurrent/thread_safe_queue.hpp"
#include "breakout/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace breakout {

// -----------------------------------------------------------------------------
// IpcServer: dual-socket ZeroMQ gateway for telemetry and commands
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that broadcasts telemetry to dashboards
//         (PUB socket) and serves the strategy control surface to remote
//         clients (REP socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. PUB socket (telemetry):
//      Broadcasts one JSON message per Event (codec::formatTelemetry):
//      notification, strategy_snapshot, strategy_removed, phase_change,
//      engine_status, tick_dropped. Events arrive through a bounded
//      ThreadSafeQueue from the publish loop; when it is full the oldest
//      event is dropped and counted, so a stalled subscriber never backs up
//      into the engine.
//
//   2. REP socket (commands):
//      Each JSON request is passed to the command handler (bound to
//      TrackerEngine::executeCommand()) and its JSON reply sent back. The
//      socket has ZMQ_RCVTIMEO so the thread alternates between command
//      polling and telemetry draining.
//
// Either endpoint may be empty, which leaves that socket closed.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread.
//
// Ownership:
//   Owned by TrackerEngine via std::unique_ptr.
//   Owns the ZMQ context, both sockets, the telemetry queue and the thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened and no threads are spawned here.
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557",
                     int utc_offset_minutes = 330,
                     std::size_t telemetry_capacity = 4096);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // 1. Creates the ZMQ context.
  // 2. Binds the REP socket (commands) and PUB socket (telemetry).
  // 3. Spawns the worker thread running run().
  //
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Idempotent; publishes what is still queued, then joins.
  void stop();

  void pushTelemetry(Event event);

  std::uint64_t telemetryDropped() const { return telemetry_dropped_.load(); }
  std::uint64_t commandsServed() const { return commands_served_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;
  int utc_offset_minutes_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  std::atomic<std::uint64_t> telemetry_dropped_{0};
  std::atomic<std::uint64_t> commands_served_{0};
};

}  // namespace breakout
