#include "margin/risk/position_index.hpp"

#include <algorithm>
#include <mutex>

namespace margin {

PositionIndex::PositionIndex(EventBus& bus, std::size_t retired_window)
    : bus_(bus), retired_window_(std::max<std::size_t>(1, retired_window)) {
  subscription_ = bus_.subscribe<PositionUpdateEvent>(
      [this](const PositionUpdateEvent& e) { onUpdate(e); });
}

PositionIndex::~PositionIndex() { bus_.unsubscribe(subscription_); }

void PositionIndex::onUpdate(const PositionUpdateEvent& event) {
  const domain::Position& p = event.position;

  std::unique_lock lock(mutex_);
  if (retired_.count(p.id) > 0) {
    return;
  }

  auto it = entries_.find(p.id);
  if (it != entries_.end() && p.version < it->second.version) {
    return;
  }

  if (!p.isOpen()) {
    entries_.erase(p.id);
    retired_.insert(p.id);
    retired_order_.push_back(p.id);
    while (retired_order_.size() > retired_window_) {
      retired_.erase(retired_order_.front());
      retired_order_.pop_front();
    }
    return;
  }

  entries_[p.id] = Entry{p.pair, p.owner, p.mode, p.version};
}

std::vector<domain::PositionId> PositionIndex::positionsForPair(
    const std::string& pair) const {
  std::vector<domain::PositionId> out;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, entry] : entries_) {
      if (entry.pair == pair) {
        out.push_back(id);
      }
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<domain::OwnerId> PositionIndex::crossOwnersForPair(
    const std::string& pair) const {
  std::vector<domain::OwnerId> out;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, entry] : entries_) {
      if (entry.pair == pair && entry.mode == domain::MarginMode::Cross) {
        out.push_back(entry.owner);
      }
    }
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

std::vector<domain::PositionId> PositionIndex::crossPositionsForOwner(
    const domain::OwnerId& owner) const {
  std::vector<domain::PositionId> out;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, entry] : entries_) {
      if (entry.owner == owner && entry.mode == domain::MarginMode::Cross) {
        out.push_back(id);
      }
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t PositionIndex::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

std::size_t PositionIndex::retiredCount() const {
  std::shared_lock lock(mutex_);
  return retired_.size();
}

}  // namespace margin
