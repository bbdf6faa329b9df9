#pragma once

#include "margin/gateway/price_feed_gateway.hpp"

#include <memory>
#include <string>
#include <thread>

namespace margin {

// -----------------------------------------------------------------------------
// PriceFeedThread — dedicated I/O thread for oracle ticks
// -----------------------------------------------------------------------------
//
// @brief  Runs the PriceFeedGateway's blocking receive loop on its own
//         std::thread so network I/O never touches the monitor loop.
//
// @details
// The gateway has its own recv loop with a timeout rather than a queue, so
// this is a plain thread instead of an EventLoopThread. Decoded ticks go to
// the sink, which the MarginEngine binds to pushPriceTick().
//
// Thread model:
//   start() and stop() are called from the owning thread (MarginEngine).
//
// Ownership:
//   Owned by MarginEngine via std::unique_ptr. Owns the gateway.
// -----------------------------------------------------------------------------
class PriceFeedThread {
 public:
  // The gateway (and its socket) is created in start(), not here.
  PriceFeedThread(PriceFeedGateway::TickSink sink,
                  std::string endpoint = "tcp://127.0.0.1:5555");

  ~PriceFeedThread();

  PriceFeedThread(const PriceFeedThread&) = delete;
  PriceFeedThread& operator=(const PriceFeedThread&) = delete;
  PriceFeedThread(PriceFeedThread&&) = delete;
  PriceFeedThread& operator=(PriceFeedThread&&) = delete;

  // Connects the gateway and spawns the recv thread. No-op if running.
  void start();

  // Signals the gateway and joins. Idempotent.
  void stop();

 private:
  PriceFeedGateway::TickSink sink_;
  std::string endpoint_;

  std::unique_ptr<PriceFeedGateway> gateway_;
  std::thread thread_;
};

}  // namespace margin
