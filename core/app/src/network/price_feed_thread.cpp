#include "margin/network/price_feed_thread.hpp"

#include <iostream>
#include <utility>

namespace margin {

PriceFeedThread::PriceFeedThread(PriceFeedGateway::TickSink sink,
                                 std::string endpoint)
    : sink_(std::move(sink)), endpoint_(std::move(endpoint)) {}

PriceFeedThread::~PriceFeedThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): connect on the caller's thread, receive on the feed thread
// -----------------------------------------------------------------------------
// Connecting here means a malformed endpoint fails start() with
// zmq::error_t instead of killing a detached thread.
// -----------------------------------------------------------------------------
void PriceFeedThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<PriceFeedGateway>(sink_, endpoint_);
  std::cout << "[PriceFeedThread] subscribed to " << endpoint_ << "\n";

  thread_ = std::thread([gateway = gateway_.get()] { gateway->run(); });
}

// -----------------------------------------------------------------------------
// stop(): ticks stop here first during engine shutdown
// -----------------------------------------------------------------------------
void PriceFeedThread::stop() {
  if (!gateway_) {
    return;
  }

  gateway_->stop();
  if (thread_.joinable()) {
    thread_.join();
  }

  std::cout << "[PriceFeedThread] stopped. " << gateway_->deliveredCount()
            << " tick(s) delivered, " << gateway_->malformedCount()
            << " malformed message(s) skipped.\n";
  gateway_.reset();
}

}  // namespace margin
