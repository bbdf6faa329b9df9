#include "margin/eventbus/event_bus.hpp"
#include <algorithm>

namespace margin {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  auto next = std::make_shared<SubscriberList>(*subscribers_);
  next->emplace_back(id, std::move(callback));
  subscribers_ = std::move(next);
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id): unknown ids leave the list untouched
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  const auto it = std::find_if(
      subscribers_->begin(), subscribers_->end(),
      [id](const SubscriberEntry& e) { return e.first == id; });
  if (it == subscribers_->end()) {
    return;
  }
  auto next = std::make_shared<SubscriberList>();
  next->reserve(subscribers_->size() - 1);
  for (const auto& entry : *subscribers_) {
    if (entry.first != id) {
      next->push_back(entry);
    }
  }
  subscribers_ = std::move(next);
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
// A subscriber added while this publish is running misses this one event.
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  const auto list = snapshot();
  for (const auto& entry : *list) {
    entry.second(event);
  }
}

std::size_t EventBus::subscriberCount() const { return snapshot()->size(); }

std::shared_ptr<const EventBus::SubscriberList> EventBus::snapshot() const {
  std::lock_guard lock(mutex_);
  return subscribers_;
}

}  // namespace margin
