#include "margin/ledger/in_memory_wallet.hpp"

#include <iostream>

namespace margin {

void InMemoryWallet::deposit(const domain::OwnerId& owner, double amount) {
  std::lock_guard lock(mutex_);
  accounts_[owner].free += amount;
}

domain::Result<domain::ReservationId> InMemoryWallet::reserve(
    const domain::OwnerId& owner, double amount) {
  std::lock_guard lock(mutex_);

  Account& account = accounts_[owner];
  if (!(amount > 0.0) || account.free < amount) {
    return domain::ErrorCode::InsufficientCollateral;
  }

  account.free -= amount;
  account.reserved += amount;

  const domain::ReservationId id = reservation_ids_.next_id();
  reservations_.emplace(id, owner);
  return id;
}

domain::Result<domain::ReservationId> InMemoryWallet::topUp(
    domain::ReservationId reservation, double amount) {
  std::lock_guard lock(mutex_);

  auto it = reservations_.find(reservation);
  if (it == reservations_.end()) {
    std::cerr << "[InMemoryWallet] top-up of unknown reservation "
              << reservation << "\n";
    return domain::ErrorCode::InsufficientCollateral;
  }

  Account& account = accounts_[it->second];
  if (!(amount > 0.0) || account.free < amount) {
    return domain::ErrorCode::InsufficientCollateral;
  }
  account.free -= amount;
  account.reserved += amount;
  return reservation;
}

void InMemoryWallet::release(domain::ReservationId reservation,
                             double amount) {
  std::lock_guard lock(mutex_);

  auto it = reservations_.find(reservation);
  if (it == reservations_.end()) {
    std::cerr << "[InMemoryWallet] release against unknown reservation "
              << reservation << "\n";
    return;
  }

  Account& account = accounts_[it->second];
  account.free += amount;
  account.released += amount;
  ++release_counts_[reservation];
}

std::size_t InMemoryWallet::reservationCount() const {
  std::lock_guard lock(mutex_);
  return reservations_.size();
}

double InMemoryWallet::balance(const domain::OwnerId& owner) const {
  std::lock_guard lock(mutex_);
  auto it = accounts_.find(owner);
  return it == accounts_.end() ? 0.0 : it->second.free;
}

double InMemoryWallet::totalReserved(const domain::OwnerId& owner) const {
  std::lock_guard lock(mutex_);
  auto it = accounts_.find(owner);
  return it == accounts_.end() ? 0.0 : it->second.reserved;
}

double InMemoryWallet::totalReleased(const domain::OwnerId& owner) const {
  std::lock_guard lock(mutex_);
  auto it = accounts_.find(owner);
  return it == accounts_.end() ? 0.0 : it->second.released;
}

std::size_t InMemoryWallet::releaseCount(
    domain::ReservationId reservation) const {
  std::lock_guard lock(mutex_);
  auto it = release_counts_.find(reservation);
  return it == release_counts_.end() ? 0 : it->second;
}

}  // namespace margin
