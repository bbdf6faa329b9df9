#include "margin/ledger/leverage_setting_store.hpp"

#include <mutex>
#include <utility>

namespace margin {

LeverageSettingStore::LeverageSettingStore(domain::LeverageSetting defaults,
                                           int max_leverage_ceiling)
    : defaults_(std::move(defaults)),
      max_leverage_ceiling_(max_leverage_ceiling) {}

domain::LeverageSetting LeverageSettingStore::get(
    const domain::OwnerId& owner) const {
  {
    std::shared_lock lock(mutex_);
    auto it = settings_.find(owner);
    if (it != settings_.end()) {
      return it->second;
    }
  }

  domain::LeverageSetting setting = defaults_;
  setting.owner = owner;
  return setting;
}

domain::Result<domain::LeverageSetting> LeverageSettingStore::put(
    domain::LeverageSetting setting) {
  if (setting.owner.empty()) {
    return domain::ErrorCode::InvalidRequest;
  }
  if (setting.max_leverage < 1 ||
      setting.max_leverage > max_leverage_ceiling_ ||
      setting.preferred_leverage < 1 ||
      setting.preferred_leverage > setting.max_leverage) {
    return domain::ErrorCode::InvalidLeverage;
  }

  std::unique_lock lock(mutex_);
  settings_[setting.owner] = setting;
  return setting;
}

}  // namespace margin
