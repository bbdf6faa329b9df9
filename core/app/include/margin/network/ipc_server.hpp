#pragma once

#include "margin/concurrent/thread_safe_queue.hpp"
#include "margin/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace margin {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ command and telemetry gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers JSON commands from external
//         clients (REP socket) and broadcasts position, liquidation and risk
//         telemetry (PUB socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (tcp://127.0.0.1:5556 by default):
//      Each received command string is handed to command_handler_ (bound to
//      MarginEngine::executeCommand()) and its JSON response is sent back.
//      The thread waits in zmq::poll() for at most kPollTimeoutMs, so
//      telemetry still flows while no client is talking. REP requires a
//      reply to every request: a handler that throws is answered with an
//      InvalidRequest error line.
//
//   2. PUB socket (tcp://127.0.0.1:5557 by default):
//      Telemetry events arrive through pushTelemetry() from whichever thread
//      published them on the engine bus, wait in a ThreadSafeQueue, and are
//      formatted with formatTelemetry() and sent on this thread, at most
//      kTelemetryBatch per loop turn so a burst cannot starve commands.
//      Events pushed after stop() are dropped.
//
// Thread model:
//   start() and stop() are called from the owning thread (MarginEngine).
//   pushTelemetry() is safe from any thread. command_handler_ runs on the
//   IPC thread.
//
// Ownership:
//   Owned by MarginEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened and no thread is spawned until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Binds both sockets and spawns the IPC thread. No-op if running.
  //
  // @details
  // A bind failure (endpoint in use, malformed address) propagates as
  // zmq::error_t: the engine cannot serve commands without its socket.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it, closes the sockets. Idempotent.
  void stop();

  // Queues one event for the PUB socket. Thread-safe.
  void pushTelemetry(Event event);

  std::uint64_t commandsServed() const { return commands_served_.load(); }
  std::uint64_t telemetrySent() const { return telemetry_sent_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;
  static constexpr std::size_t kTelemetryBatch = 256;

  void run();
  void publishTelemetry(std::size_t limit);
  bool waitForCommand();
  void serveCommand();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> commands_served_{0};
  std::atomic<std::uint64_t> telemetry_sent_{0};
};

}  // namespace margin
