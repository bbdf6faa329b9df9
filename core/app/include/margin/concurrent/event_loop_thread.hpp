#pragma once

#include "margin/concurrent/thread_safe_queue.hpp"
#include "margin/eventbus/event_bus.hpp"
#include "margin/events/event.hpp"
#include <thread>

namespace margin {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns a single worker thread that drains a
// ThreadSafeQueue<Event> and publishes each event to its own EventBus on
// that thread. Other threads push(); subscribers of the loop's bus run only
// on the loop thread, so their handling is serialized.
//
// Why in architecture: The MarginEngine runs one of these as the monitor
// loop. The price feed thread (or a test) pushes PriceTickEvents; the loop
// thread feeds them to the PriceFeedAdapter and the LiquidationMonitor one
// at a time, in arrival order.
//
// Thread model: start() and stop() may be called from any thread. push() is
// thread-safe. stop() closes the queue: events already queued are still
// published, then the worker exits and is joined.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Joins the worker if it is still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // What: Starts the worker thread. No-op if already running. A loop that
  // has been stopped cannot be restarted (its queue is closed).
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Closes the queue, lets the worker drain what is left, joins it.
  // Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // push(event)
  // -------------------------------------------------------------------------
  // What: Enqueues one event for publication on the loop thread.
  // Output: false if the loop has been stopped and the event was dropped.
  // -------------------------------------------------------------------------
  bool push(Event event) { return queue_.push(std::move(event)); }

  // Bus the loop publishes to. Subscribe here to run on the loop thread.
  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  // Blocking pop until the queue is closed and empty.
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::thread thread_;
};

}  // namespace margin
