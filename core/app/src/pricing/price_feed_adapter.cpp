#include "margin/pricing/price_feed_adapter.hpp"

#include <cctype>
#include <mutex>

namespace margin {

std::string PriceFeedAdapter::normalizeSymbol(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    if (c == '-' || c == '_') {
      out.push_back('/');
    } else if (!std::isspace(static_cast<unsigned char>(c))) {
      out.push_back(static_cast<char>(
          std::toupper(static_cast<unsigned char>(c))));
    }
  }
  return out;
}

std::optional<PriceTickEvent> PriceFeedAdapter::ingest(
    const PriceTickEvent& tick) {
  PriceTickEvent canonical = tick;
  canonical.symbol = normalizeSymbol(tick.symbol);

  std::unique_lock lock(mutex_);

  if (canonical.symbol.empty() || !(canonical.price > 0.0)) {
    ++discarded_;
    return std::nullopt;
  }

  auto it = latest_.find(canonical.symbol);
  if (it != latest_.end() &&
      canonical.timestamp_ms <= it->second.timestamp_ms) {
    ++discarded_;
    return std::nullopt;
  }

  latest_[canonical.symbol] = canonical;
  return canonical;
}

std::optional<PriceTickEvent> PriceFeedAdapter::latest(
    const std::string& pair) const {
  std::shared_lock lock(mutex_);
  auto it = latest_.find(normalizeSymbol(pair));
  if (it == latest_.end()) {
    return std::nullopt;
  }
  return it->second;
}

MarkMap PriceFeedAdapter::marks() const {
  std::shared_lock lock(mutex_);
  MarkMap out;
  out.reserve(latest_.size());
  for (const auto& [pair, tick] : latest_) {
    out.emplace(pair, tick.price);
  }
  return out;
}

std::uint64_t PriceFeedAdapter::discardedCount() const {
  std::shared_lock lock(mutex_);
  return discarded_;
}

}  // namespace margin
