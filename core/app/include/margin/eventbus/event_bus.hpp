#pragma once

#include "margin/events/event.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace margin {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for position updates,
// liquidations and risk alerts. Subscribers register callbacks; publishers
// post Event values; every matching subscriber is invoked.
//
// Why in architecture: The ledger does not know who watches it. The position
// index, the IPC telemetry bridge and tests all attach here, so adding an
// observer never touches the ledger or the monitor.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe, and
// publish from any thread. Callbacks run synchronously on the thread that
// calls publish(). Ledger mutations commit on several threads (IPC, worker
// pool), so subscribers must do their own locking.
//
// The subscriber list is copy-on-write: subscribe() and unsubscribe() build
// a new list, publish() only takes a reference to the current one. Publishing
// happens on every mutation, subscribing a handful of times per run.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked for every published event.
  // Thread-safety: Safe to call from any thread.
  // Output: SubscriptionId to use with unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked only when the published event holds
  // an EventType (e.g. PositionUpdateEvent).
  // Thread-safety: Same as subscribe(GenericCallback); implemented by
  // wrapping in a generic callback that checks the variant type.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // What: Removes the subscription. If publish() is in progress on another
  // thread the callback may still run for that one event.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // What: Delivers the event to all registered subscribers on the calling
  // thread, in subscription order, before returning.
  // Thread-safety: Callbacks run on a snapshot of the list without the
  // lock, so a callback may publish, subscribe or unsubscribe.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;
  using SubscriberList = std::vector<SubscriberEntry>;

  std::shared_ptr<const SubscriberList> snapshot() const;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::shared_ptr<const SubscriberList> subscribers_{
      std::make_shared<SubscriberList>()};
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace margin
