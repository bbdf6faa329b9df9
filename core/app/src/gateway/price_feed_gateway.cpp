#include "margin/gateway/price_feed_gateway.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <optional>
#include <utility>

namespace margin {

// -----------------------------------------------------------------------------
// Constructor: create ZMQ SUB socket with receive timeout
// -----------------------------------------------------------------------------
PriceFeedGateway::PriceFeedGateway(TickSink sink, const std::string& endpoint)
    : sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");

  // Without a receive timeout recv() blocks forever and stop() is never
  // observed.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.set(zmq::sockopt::linger, 0);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// decode()
// -----------------------------------------------------------------------------
std::optional<PriceTickEvent> PriceFeedGateway::decode(
    const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    const auto& price = json.at("price");
    const auto& timestamp = json.at("timestamp_ms");
    if (!price.is_number() || !timestamp.is_number_integer()) {
      return std::nullopt;
    }

    PriceTickEvent tick;
    tick.symbol = json.at("symbol").get<std::string>();
    tick.price = price.get<double>();
    tick.timestamp_ms = timestamp.get<std::int64_t>();
    return tick;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[PriceFeedGateway] JSON error: " << e.what()
              << " payload: " << payload << "\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop, call from a dedicated thread
// -----------------------------------------------------------------------------
void PriceFeedGateway::run() {
  while (!stop_requested_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;

    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == ETERM) {
        return;
      }
      if (e.num() != EINTR) {
        std::cerr << "[PriceFeedGateway] receive failed: " << e.what() << "\n";
      }
      continue;
    }

    if (!result.has_value()) {
      // Timeout: re-check the stop flag.
      continue;
    }

    auto tick = decode(msg.to_string());
    if (!tick) {
      ++malformed_;
      continue;
    }

    tick->sequence_id = next_sequence_++;
    sink_(std::move(*tick));
    ++delivered_;
  }
}

void PriceFeedGateway::stop() { stop_requested_.store(true); }

}  // namespace margin
