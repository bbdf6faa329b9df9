#pragma once

#include "margin/domain/error_code.hpp"
#include "margin/domain/position_types.hpp"

namespace margin {

// -----------------------------------------------------------------------------
// ICollateralWallet — external collateral ledger contract
// -----------------------------------------------------------------------------
//
// @brief  The only two calls the margin engine makes against the wallet that
//         holds owners' collateral.
//
// @details
// The engine never custodies funds and never looks inside the wallet.
//
//   reserve(owner, amount)  Locks `amount` of the owner's free balance for a
//                           position. Fails with InsufficientCollateral if
//                           the owner cannot cover it.
//   topUp(id, amount)       Locks `amount` more under an existing
//                           reservation (margin added to an open position).
//                           Same failure as reserve().
//   release(id, amount)     Credits `amount` back to the owner of the
//                           reservation. The amount may be more than was
//                           reserved (realized profit), less (loss or fees),
//                           or zero (liquidated to nothing). Never negative.
//
// PositionLedger performs exactly one of these calls per funds-moving
// mutation, inside the same critical section as the position change.
//
// Thread-safety contract:
//   Implementations MUST be safe to call concurrently from any thread.
//
// Ownership:
//   Owned outside the engine (main() or the test); the engine holds a
//   reference and the wallet must outlive it.
// -----------------------------------------------------------------------------
class ICollateralWallet {
 public:
  virtual ~ICollateralWallet() = default;

  virtual domain::Result<domain::ReservationId> reserve(
      const domain::OwnerId& owner, double amount) = 0;

  virtual domain::Result<domain::ReservationId> topUp(
      domain::ReservationId reservation, double amount) = 0;

  virtual void release(domain::ReservationId reservation, double amount) = 0;
};

}  // namespace margin
