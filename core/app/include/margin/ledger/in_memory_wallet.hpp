#pragma once

#include "margin/concurrent/id_generator.hpp"
#include "margin/ledger/i_collateral_wallet.hpp"

#include <mutex>
#include <unordered_map>

namespace margin {

// -----------------------------------------------------------------------------
// InMemoryWallet — process-local ICollateralWallet
// -----------------------------------------------------------------------------
//
// @brief  Free balance per owner plus gross reserve/release counters. Backs
//         the margin_engine executable (seeded from config) and the tests.
//
// @details
// reserve() moves funds out of the free balance; release() credits the
// reservation's owner. Because a release can be larger or smaller than what
// was reserved, the wallet keeps gross totals instead of a per-reservation
// "still locked" figure:
//
//   totalReserved(owner)  sum of all successful reserve() and topUp() amounts
//   totalReleased(owner)  sum of all release() amounts
//
// Releasing against an unknown reservation is logged and ignored; topping
// one up fails with InsufficientCollateral.
//
// Thread model:
//   One std::mutex guards all maps. Calls are short and never re-enter.
// -----------------------------------------------------------------------------
class InMemoryWallet final : public ICollateralWallet {
 public:
  InMemoryWallet() = default;

  InMemoryWallet(const InMemoryWallet&) = delete;
  InMemoryWallet& operator=(const InMemoryWallet&) = delete;

  void deposit(const domain::OwnerId& owner, double amount);

  domain::Result<domain::ReservationId> reserve(const domain::OwnerId& owner,
                                                double amount) override;

  domain::Result<domain::ReservationId> topUp(
      domain::ReservationId reservation, double amount) override;

  void release(domain::ReservationId reservation, double amount) override;

  // Number of reservations handed out by reserve().
  std::size_t reservationCount() const;

  double balance(const domain::OwnerId& owner) const;
  double totalReserved(const domain::OwnerId& owner) const;
  double totalReleased(const domain::OwnerId& owner) const;
  std::size_t releaseCount(domain::ReservationId reservation) const;

 private:
  struct Account {
    double free{0.0};
    double reserved{0.0};
    double released{0.0};
  };

  mutable std::mutex mutex_;
  IdGenerator reservation_ids_;
  std::unordered_map<domain::OwnerId, Account> accounts_;
  std::unordered_map<domain::ReservationId, domain::OwnerId> reservations_;
  std::unordered_map<domain::ReservationId, std::size_t> release_counts_;
};

}  // namespace margin
