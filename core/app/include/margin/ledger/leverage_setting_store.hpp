#pragma once

#include "margin/domain/error_code.hpp"
#include "margin/domain/leverage_setting.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace margin {

// -----------------------------------------------------------------------------
// LeverageSettingStore — per-owner LeverageSetting lookup
// -----------------------------------------------------------------------------
//
// @brief  get() is read on every open and adjust; put() is the
//         account-settings side writing an owner's guardrails.
//
// @details
// An owner with no saved setting gets the configured defaults, with the
// owner field filled in. put() rejects a max_leverage outside
// [1, max_leverage_ceiling] or a preferred_leverage outside
// [1, max_leverage] with InvalidLeverage; nothing is clamped.
//
// Lowering max_leverage does not touch positions already open above it.
// The new limit applies to their next adjust.
//
// Thread model:
//   std::shared_mutex; get() from many threads, put() rarely.
// -----------------------------------------------------------------------------
class LeverageSettingStore {
 public:
  explicit LeverageSettingStore(domain::LeverageSetting defaults = {},
                                int max_leverage_ceiling = 125);

  LeverageSettingStore(const LeverageSettingStore&) = delete;
  LeverageSettingStore& operator=(const LeverageSettingStore&) = delete;

  domain::LeverageSetting get(const domain::OwnerId& owner) const;

  domain::Result<domain::LeverageSetting> put(domain::LeverageSetting setting);

 private:
  domain::LeverageSetting defaults_;
  int max_leverage_ceiling_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::OwnerId, domain::LeverageSetting> settings_;
};

}  // namespace margin
