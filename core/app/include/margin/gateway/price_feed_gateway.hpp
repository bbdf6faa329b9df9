#pragma once

#include "margin/events/event_types.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace margin {

// -----------------------------------------------------------------------------
// PriceFeedGateway — ZeroMQ bridge from the Price Oracle
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to the oracle's PUB socket, decodes each JSON message
//         into a PriceTickEvent and hands it to the tick sink.
//
// @details
// Wire format, one JSON object per ZMQ message:
//
//   {"symbol": "ETH-USDT", "price": 1842.5, "timestamp_ms": 1717000000000}
//
// The symbol is passed on as received; the PriceFeedAdapter canonicalizes
// it and decides whether the tick is fresh. A malformed message is logged
// and skipped, the loop keeps running.
//
// Thread model:
//   run() blocks and is called on the PriceFeedThread. stop() may be called
//   from any thread, also before run() has started; run() notices within
//   kRecvTimeoutMs.
//
// Ownership:
//   Owns its ZMQ context and SUB socket. Holds a copy of the sink.
// -----------------------------------------------------------------------------
class PriceFeedGateway {
 public:
  using TickSink = std::function<void(PriceTickEvent)>;

  explicit PriceFeedGateway(TickSink sink,
                            const std::string& endpoint = "tcp://127.0.0.1:5555");

  PriceFeedGateway(const PriceFeedGateway&) = delete;
  PriceFeedGateway& operator=(const PriceFeedGateway&) = delete;
  PriceFeedGateway(PriceFeedGateway&&) = delete;
  PriceFeedGateway& operator=(PriceFeedGateway&&) = delete;

  // Blocking receive loop until stop() or until the context terminates.
  void run();

  void stop();

  // Decodes one oracle message. nullopt if it is not a well-formed tick.
  static std::optional<PriceTickEvent> decode(const std::string& payload);

  std::uint64_t deliveredCount() const { return delivered_.load(); }
  std::uint64_t malformedCount() const { return malformed_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  TickSink sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> stop_requested_{false};
  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> malformed_{0};
  std::uint64_t next_sequence_{1};  // Touched only by run()
};

}  // namespace margin
