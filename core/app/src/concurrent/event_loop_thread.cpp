#include "margin/concurrent/event_loop_thread.hpp"

namespace margin {

// -----------------------------------------------------------------------------
// Destructor
// -----------------------------------------------------------------------------
// The worker touches queue_ and bus_; it must be joined before they go.
// -----------------------------------------------------------------------------
EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable() || queue_.closed()) {
    return;
  }

  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  queue_.close();

  if (!thread_.joinable()) {
    return;
  }

  // pop() wakes on close() and returns nullopt once the backlog is drained.
  thread_.join();
}

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (std::optional<Event> event = queue_.pop()) {
    bus_.publish(*event);
  }
}

}  // namespace margin
