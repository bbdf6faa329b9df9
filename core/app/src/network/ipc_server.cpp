#include "margin/network/ipc_server.hpp"

#include "margin/domain/error_code.hpp"
#include "margin/network/command_codec.hpp"

#include <cerrno>
#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace margin {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind both sockets, then spawn the IPC thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  // Pending telemetry must not hold up shutdown.
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening. commands=" << cmd_endpoint_
            << " telemetry=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): refuse new telemetry, let the thread flush, join, close sockets
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  telemetry_queue_.close();
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped after " << commands_served_.load()
            << " command(s) and " << telemetry_sent_.load()
            << " telemetry message(s).\n";
}

void IpcServer::pushTelemetry(Event event) {
  // After stop() the queue is closed and the event is dropped.
  (void)telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): wait for a command or the poll timeout, then flush telemetry
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    if (waitForCommand()) {
      serveCommand();
    }
    publishTelemetry(kTelemetryBatch);
  }

  // Everything queued before stop() still goes out.
  publishTelemetry(telemetry_queue_.size());
}

bool IpcServer::waitForCommand() {
  zmq::pollitem_t items[] = {{cmd_socket_->handle(), 0, ZMQ_POLLIN, 0}};
  try {
    zmq::poll(items, 1, std::chrono::milliseconds(kPollTimeoutMs));
  } catch (const zmq::error_t& e) {
    if (e.num() != EINTR) {
      std::cerr << "[IpcServer] poll failed: " << e.what() << "\n";
    }
    return false;
  }
  return (items[0].revents & ZMQ_POLLIN) != 0;
}

// -----------------------------------------------------------------------------
// serveCommand(): one REP round trip
// -----------------------------------------------------------------------------
void IpcServer::serveCommand() {
  zmq::message_t request;
  try {
    if (!cmd_socket_->recv(request, zmq::recv_flags::dontwait)) {
      return;
    }
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] command receive failed: " << e.what() << "\n";
    return;
  }

  const std::string cmd(static_cast<const char*>(request.data()),
                        request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] INTERNAL: command handler threw: " << e.what()
              << "\n";
    response = encodeError(domain::ErrorCode::InvalidRequest);
  }

  try {
    cmd_socket_->send(zmq::buffer(response), zmq::send_flags::none);
    ++commands_served_;
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] command reply failed: " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// publishTelemetry(): send up to `limit` queued events on the PUB socket
// -----------------------------------------------------------------------------
void IpcServer::publishTelemetry(std::size_t limit) {
  for (std::size_t sent = 0; sent < limit; ++sent) {
    auto event = telemetry_queue_.try_pop();
    if (!event) {
      return;
    }
    auto line = formatTelemetry(*event);
    if (!line) {
      continue;
    }
    try {
      pub_socket_->send(zmq::buffer(*line), zmq::send_flags::dontwait);
      ++telemetry_sent_;
    } catch (const zmq::error_t& e) {
      std::cerr << "[IpcServer] telemetry send failed: " << e.what() << "\n";
    }
  }
}

}  // namespace margin
