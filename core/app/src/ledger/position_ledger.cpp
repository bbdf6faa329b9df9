#include "margin/ledger/position_ledger.hpp"

#include "margin/events/liquidation_event.hpp"
#include "margin/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace margin {

namespace {

// Relative slack for the collateral x leverage >= notional checks, so a
// request sized exactly at the limit is not rejected by rounding.
constexpr double kLimitTolerance = 1e-9;

bool isFinitePositive(double v) { return std::isfinite(v) && v > 0.0; }

// Stop-loss must sit on the losing side of the entry, take-profit on the
// winning side.
bool triggersValid(domain::Side side, double entry,
                   const std::optional<double>& stop_loss,
                   const std::optional<double>& take_profit) {
  const bool is_long = side == domain::Side::Long;
  if (stop_loss) {
    if (!isFinitePositive(*stop_loss)) return false;
    if (is_long ? *stop_loss >= entry : *stop_loss <= entry) return false;
  }
  if (take_profit) {
    if (!isFinitePositive(*take_profit)) return false;
    if (is_long ? *take_profit <= entry : *take_profit >= entry) return false;
  }
  return true;
}

std::optional<domain::ErrorCode> checkMutable(const domain::Position& p,
                                              std::uint64_t expected_version) {
  if (p.version != expected_version) {
    return domain::ErrorCode::VersionConflict;
  }
  if (!p.isOpen()) {
    return domain::ErrorCode::PositionNotOpen;
  }
  return std::nullopt;
}

}  // namespace

PositionLedger::PositionLedger(EventBus& bus, ICollateralWallet& wallet,
                               const LeverageSettingStore& settings,
                               IHistoryRecorder& history,
                               const PriceFeedAdapter& prices,
                               const ITimeProvider& clock,
                               domain::MarginParams params,
                               std::vector<std::string> tradable_pairs)
    : bus_(bus),
      wallet_(wallet),
      settings_(settings),
      history_(history),
      prices_(prices),
      clock_(clock),
      calculator_(params) {
  for (const auto& pair : tradable_pairs) {
    tradable_pairs_.insert(PriceFeedAdapter::normalizeSymbol(pair));
  }
  position_ids_.reseed(history_.maxPositionId());
}

// -----------------------------------------------------------------------------
// open()
// -----------------------------------------------------------------------------
domain::Result<domain::Position> PositionLedger::open(
    const domain::OpenRequest& request) {
  const std::string pair = PriceFeedAdapter::normalizeSymbol(request.pair);
  if (request.owner.empty() || pair.empty() ||
      !isFinitePositive(request.size) ||
      !isFinitePositive(request.collateral)) {
    return domain::ErrorCode::InvalidRequest;
  }

  const domain::LeverageSetting setting = settings_.get(request.owner);
  if (request.leverage < 1 || request.leverage > setting.max_leverage) {
    return domain::ErrorCode::InvalidLeverage;
  }

  if (!isTradable(pair)) {
    return domain::ErrorCode::PairUnavailable;
  }
  const auto tick = prices_.latest(pair);
  if (!tick) {
    return domain::ErrorCode::PairUnavailable;
  }

  domain::Position p;
  p.owner = request.owner;
  p.pair = pair;
  p.side = request.side;
  p.leverage = request.leverage;
  p.entry_price = tick->price;
  p.size = request.size;
  p.collateral = request.collateral;
  p.mode = request.mode.value_or(setting.default_mode);
  p.stop_loss = request.stop_loss;
  p.take_profit = request.take_profit;

  if (!triggersValid(p.side, p.entry_price, p.stop_loss, p.take_profit)) {
    return domain::ErrorCode::InvalidRequest;
  }

  const double notional = p.entryNotional();
  if (p.collateral * p.leverage < notional * (1.0 - kLimitTolerance)) {
    return domain::ErrorCode::InsufficientCollateral;
  }

  const double open_fee = calculator_.params().trading_fee_rate * notional;
  p.fees_accrued = open_fee;
  p.fees_outstanding = open_fee;

  // Id first: a cross group is summed in id order, so the new member must
  // already hold its final place when its liquidation price is computed.
  p.id = position_ids_.next_id();
  const auto siblings = p.mode == domain::MarginMode::Cross
                            ? openCrossSiblings(p.owner, p.id)
                            : std::vector<domain::Position>{};
  if (auto err = reprice(p, siblings)) {
    return *err;
  }

  auto reservation = wallet_.reserve(p.owner, p.collateral);
  if (!reservation.ok()) {
    return reservation.error();
  }
  p.reservation_id = reservation.value();

  const std::int64_t now = clock_.now_ms();
  p.opened_at_ms = now;
  p.updated_at_ms = now;
  p.version = 0;
  p.status = domain::PositionStatus::Open;

  auto slot = std::make_shared<Slot>();
  slot->position = p;
  {
    std::unique_lock lock(table_mutex_);
    slots_.emplace(p.id, std::move(slot));
    by_owner_[p.owner].push_back(p.id);
  }

  std::cout << "[PositionLedger] opened position " << p.id << " owner="
            << p.owner << " " << p.pair << " " << domain::toString(p.side)
            << " " << p.leverage << "x size=" << p.size
            << " entry=" << p.entry_price << " liq=" << p.liquidation_price
            << " mode=" << domain::toString(p.mode) << "\n";

  publishUpdate(p, PositionChange::Opened);
  if (p.mode == domain::MarginMode::Cross) {
    refreshCrossSiblings(p.owner, p.id);
  }
  return withMarks(p);
}

// -----------------------------------------------------------------------------
// adjustCollateral()
// -----------------------------------------------------------------------------
domain::Result<domain::Position> PositionLedger::adjustCollateral(
    domain::PositionId id, std::uint64_t expected_version, double delta) {
  if (!std::isfinite(delta) || delta == 0.0) {
    return domain::ErrorCode::InvalidRequest;
  }

  return mutate(
      id, expected_version, PositionChange::CollateralAdjusted,
      [&](domain::Position& c, const std::vector<domain::Position>& siblings)
          -> std::optional<domain::ErrorCode> {
        c.collateral += delta;
        if (!(c.collateral > 0.0)) {
          return domain::ErrorCode::InsufficientCollateral;
        }
        if (delta < 0.0) {
          const int max_leverage = settings_.get(c.owner).max_leverage;
          if (c.entryNotional() / c.collateral >
              max_leverage * (1.0 + kLimitTolerance)) {
            return domain::ErrorCode::InvalidLeverage;
          }
        }
        if (auto err = reprice(c, siblings)) {
          return err;
        }

        if (delta > 0.0) {
          auto reservation = wallet_.topUp(c.reservation_id, delta);
          if (!reservation.ok()) {
            return reservation.error();
          }
        } else {
          wallet_.release(c.reservation_id, -delta);
        }
        return std::nullopt;
      });
}

// -----------------------------------------------------------------------------
// reduce()
// -----------------------------------------------------------------------------
domain::Result<domain::Position> PositionLedger::reduce(
    domain::PositionId id, std::uint64_t expected_version, double quantity,
    std::optional<double> fill) {
  if (!isFinitePositive(quantity)) {
    return domain::ErrorCode::InvalidRequest;
  }

  const double fee_rate = calculator_.params().trading_fee_rate;
  return mutate(
      id, expected_version, PositionChange::Reduced,
      [&](domain::Position& c, const std::vector<domain::Position>& siblings)
          -> std::optional<domain::ErrorCode> {
        if (!(quantity < c.size)) {
          return domain::ErrorCode::InvalidRequest;
        }
        const auto resolved = fillPrice(c.pair, fill);
        if (!resolved.ok()) {
          return resolved.error();
        }
        const double price = resolved.value();

        const double slice_collateral = c.collateral * (quantity / c.size);
        const double slice_pnl = (price - c.entry_price) * quantity *
                                 domain::directionSign(c.side);
        const double slice_fee = fee_rate * quantity * price;

        double released = slice_collateral + slice_pnl - slice_fee;
        double remaining = c.collateral - slice_collateral;
        if (released < 0.0) {
          remaining += released;
          released = 0.0;
        }
        if (!(remaining > 0.0)) {
          return domain::ErrorCode::InsufficientCollateral;
        }

        c.size -= quantity;
        c.collateral = remaining;
        c.realized_pnl += slice_pnl - slice_fee;
        c.fees_accrued += slice_fee;
        if (auto err = reprice(c, siblings)) {
          return err;
        }

        wallet_.release(c.reservation_id, released);
        return std::nullopt;
      });
}

// -----------------------------------------------------------------------------
// close()
// -----------------------------------------------------------------------------
domain::Result<domain::Position> PositionLedger::close(
    domain::PositionId id, std::uint64_t expected_version,
    std::optional<double> fill, domain::CloseReason reason) {
  const double fee_rate = calculator_.params().trading_fee_rate;
  double pool_debit = 0.0;
  return mutate(
      id, expected_version, PositionChange::Closed,
      [&](domain::Position& c, const std::vector<domain::Position>& siblings)
          -> std::optional<domain::ErrorCode> {
        const auto resolved = fillPrice(c.pair, fill);
        if (!resolved.ok()) {
          return resolved.error();
        }
        const double close_price = resolved.value();

        const std::int64_t now = clock_.now_ms();
        const double pnl = MarginCalculator::unrealizedPnl(c, close_price);
        const double close_fee = fee_rate * c.size * close_price;
        const double net = pnl - close_fee - c.fees_outstanding;
        double released = c.collateral + net;

        // A cross position draws on the group's pool: the part of the loss
        // beyond its own collateral is owed by the siblings.
        if (released < 0.0 && c.mode == domain::MarginMode::Cross) {
          double pool = 0.0;
          for (const auto& s : siblings) {
            pool += s.collateral;
          }
          if (!(-released < pool)) {
            return domain::ErrorCode::InsufficientCollateral;
          }
          pool_debit = -released;
        }
        released = std::max(0.0, released);

        domain::ClosureRecord record;
        record.id = history_.nextRecordId();
        record.position_id = c.id;
        record.owner = c.owner;
        record.pair = c.pair;
        record.side = c.side;
        record.entry_price = c.entry_price;
        record.close_price = close_price;
        record.size = c.size;
        record.realized_pnl = c.realized_pnl + net;
        record.fees = c.fees_accrued + close_fee;
        record.released_amount = released;
        record.reason = reason;
        record.closed_at_ms = now;

        if (!history_.append(record)) {
          std::cerr << "[PositionLedger] close of position " << c.id
                    << " aborted: closure record not persisted\n";
          return domain::ErrorCode::HistoryUnavailable;
        }
        wallet_.release(c.reservation_id, released);

        c.realized_pnl = record.realized_pnl;
        c.fees_accrued = record.fees;
        c.fees_outstanding = 0.0;
        c.status = domain::PositionStatus::Closed;
        c.closed_at_ms = now;
        return std::nullopt;
      },
      [&](const domain::Position& closed) {
        if (pool_debit > 0.0) {
          debitCrossPool(closed.owner, pool_debit);
        }
      });
}

// -----------------------------------------------------------------------------
// setTriggers()
// -----------------------------------------------------------------------------
domain::Result<domain::Position> PositionLedger::setTriggers(
    domain::PositionId id, std::uint64_t expected_version,
    std::optional<double> stop_loss, std::optional<double> take_profit) {
  return mutate(
      id, expected_version, PositionChange::TriggersSet,
      [&](domain::Position& c, const std::vector<domain::Position>&)
          -> std::optional<domain::ErrorCode> {
        if (!triggersValid(c.side, c.entry_price, stop_loss, take_profit)) {
          return domain::ErrorCode::InvalidRequest;
        }
        c.stop_loss = stop_loss;
        c.take_profit = take_profit;
        return std::nullopt;
      });
}

// -----------------------------------------------------------------------------
// liquidate()
// -----------------------------------------------------------------------------
domain::Result<domain::LiquidationRecord> PositionLedger::liquidate(
    domain::PositionId id, std::uint64_t expected_version,
    std::optional<double> fill, domain::LiquidationType type) {
  domain::LiquidationRecord record;
  auto result = mutate(
      id, expected_version, PositionChange::Liquidated,
      [&](domain::Position& c, const std::vector<domain::Position>&)
          -> std::optional<domain::ErrorCode> {
        const auto resolved = fillPrice(c.pair, fill);
        if (!resolved.ok()) {
          return resolved.error();
        }
        const double mark_price = resolved.value();

        const std::int64_t now = clock_.now_ms();
        record = buildLiquidationRecord(c, mark_price, type, now);
        record.released_amount = std::max(0.0, record.remaining_collateral);

        if (!history_.append(record)) {
          std::cerr << "[PositionLedger] liquidation of position " << c.id
                    << " aborted: liquidation record not persisted\n";
          return domain::ErrorCode::HistoryUnavailable;
        }
        wallet_.release(c.reservation_id, record.released_amount);

        c.realized_pnl +=
            MarginCalculator::unrealizedPnl(c, mark_price) - c.fees_outstanding;
        c.fees_outstanding = 0.0;
        c.status = domain::PositionStatus::Liquidated;
        c.closed_at_ms = now;
        return std::nullopt;
      });

  if (!result.ok()) {
    return result.error();
  }

  if (record.remaining_collateral < 0.0) {
    std::cerr << "[PositionLedger] shortfall on liquidation of position "
              << record.position_id << ": "
              << -record.remaining_collateral << " beyond collateral\n";
  }
  std::cout << "[PositionLedger] liquidated position " << record.position_id
            << " (" << domain::toString(type) << ") at " << record.mark_price
            << " loss=" << record.loss_amount
            << " remaining=" << record.remaining_collateral << "\n";

  publishLiquidation(record);
  return record;
}

// -----------------------------------------------------------------------------
// liquidateGroup()
// -----------------------------------------------------------------------------
domain::Result<std::vector<domain::LiquidationRecord>>
PositionLedger::liquidateGroup(const domain::GroupLiquidation& group) {
  if (group.members.empty()) {
    return domain::ErrorCode::InvalidRequest;
  }

  struct Eligible {
    std::shared_ptr<Slot> slot;
    domain::GroupLiquidation::Member member;
    double remaining{0.0};
    double released{0.0};
  };

  std::vector<Eligible> eligible;
  std::optional<domain::ErrorCode> first_error;

  // Phase 1: snapshot every member and compute its own remaining collateral.
  for (const auto& member : group.members) {
    if (!isFinitePositive(member.mark_price)) {
      first_error = first_error.value_or(domain::ErrorCode::InvalidRequest);
      continue;
    }
    auto slot = findSlot(member.position_id);
    if (!slot) {
      first_error = first_error.value_or(domain::ErrorCode::PositionNotFound);
      continue;
    }

    domain::Position snapshot = copyOf(*slot);
    if (auto err = checkMutable(snapshot, member.expected_version)) {
      first_error = first_error.value_or(*err);
      continue;
    }
    if (snapshot.owner != group.owner ||
        snapshot.mode != domain::MarginMode::Cross) {
      first_error = first_error.value_or(domain::ErrorCode::InvalidRequest);
      continue;
    }

    const double loss =
        -MarginCalculator::unrealizedPnl(snapshot, member.mark_price) +
        snapshot.fees_outstanding;
    eligible.push_back({slot, member, snapshot.collateral - loss, 0.0});
  }

  // Net shortfalls against the positive remainders of the pool.
  double positive = 0.0;
  double shortfall = 0.0;
  for (const auto& e : eligible) {
    if (e.remaining > 0.0) {
      positive += e.remaining;
    } else {
      shortfall -= e.remaining;
    }
  }
  const double distributable = std::max(0.0, positive - shortfall);
  for (auto& e : eligible) {
    if (e.remaining > 0.0 && positive > 0.0) {
      e.released = e.remaining / positive * distributable;
    }
  }

  // Phase 2: commit member by member.
  std::vector<domain::LiquidationRecord> records;
  std::vector<domain::Position> committed;
  for (auto& e : eligible) {
    domain::LiquidationRecord record;
    domain::Position after;
    {
      std::lock_guard lock(e.slot->mutex);
      domain::Position& p = e.slot->position;
      if (auto err = checkMutable(p, e.member.expected_version)) {
        first_error = first_error.value_or(*err);
        continue;
      }

      const std::int64_t now = clock_.now_ms();
      record = buildLiquidationRecord(p, e.member.mark_price, group.type, now);
      record.released_amount = e.released;

      if (!history_.append(record)) {
        std::cerr << "[PositionLedger] group liquidation of owner "
                  << group.owner << " stopped at position " << p.id
                  << ": liquidation record not persisted\n";
        first_error = first_error.value_or(domain::ErrorCode::HistoryUnavailable);
        break;
      }
      wallet_.release(p.reservation_id, e.released);

      p.realized_pnl +=
          MarginCalculator::unrealizedPnl(p, e.member.mark_price) -
          p.fees_outstanding;
      p.fees_outstanding = 0.0;
      p.status = domain::PositionStatus::Liquidated;
      p.closed_at_ms = now;
      p.updated_at_ms = now;
      ++p.version;
      after = p;
    }
    records.push_back(record);
    committed.push_back(after);
  }

  if (records.empty()) {
    return first_error.value_or(domain::ErrorCode::PositionNotOpen);
  }

  std::cout << "[PositionLedger] cross group of owner " << group.owner
            << " liquidated: " << records.size() << " position(s), netted "
            << "shortfall=" << shortfall << " released=" << distributable
            << "\n";
  if (shortfall > positive) {
    std::cerr << "[PositionLedger] shortfall on cross group of owner "
              << group.owner << ": " << shortfall - positive
              << " beyond pooled collateral\n";
  }

  for (std::size_t i = 0; i < records.size(); ++i) {
    publishUpdate(committed[i], PositionChange::Liquidated);
    publishLiquidation(records[i]);
  }
  refreshCrossSiblings(group.owner, 0);
  return records;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionLedger::get(
    domain::PositionId id) const {
  auto slot = findSlot(id);
  if (!slot) {
    return std::nullopt;
  }
  return withMarks(copyOf(*slot));
}

std::vector<domain::Position> PositionLedger::positionsByOwner(
    const domain::OwnerId& owner) const {
  std::vector<domain::Position> out;
  for (const auto& slot : ownerSlots(owner)) {
    out.push_back(withMarks(copyOf(*slot)));
  }
  return out;
}

std::vector<domain::Position> PositionLedger::openPositions() const {
  std::vector<std::shared_ptr<Slot>> all;
  {
    std::shared_lock lock(table_mutex_);
    all.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
      all.push_back(slot);
    }
  }

  std::vector<domain::Position> out;
  for (const auto& slot : all) {
    domain::Position p = copyOf(*slot);
    if (p.isOpen()) {
      out.push_back(withMarks(std::move(p)));
    }
  }
  std::sort(out.begin(), out.end(),
            [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

std::vector<domain::Position> PositionLedger::crossGroup(
    const domain::OwnerId& owner) const {
  std::vector<domain::Position> out = openCrossSiblings(owner, 0);
  for (auto& p : out) {
    p = withMarks(std::move(p));
  }
  return out;
}

// -----------------------------------------------------------------------------
// hydratePosition()
// -----------------------------------------------------------------------------
void PositionLedger::hydratePosition(const domain::Position& position) {
  domain::Position p = position;
  p.pair = PriceFeedAdapter::normalizeSymbol(p.pair);
  {
    std::unique_lock lock(table_mutex_);
    auto it = slots_.find(p.id);
    if (it == slots_.end()) {
      auto slot = std::make_shared<Slot>();
      slot->position = p;
      slots_.emplace(p.id, std::move(slot));
      by_owner_[p.owner].push_back(p.id);
    } else {
      std::lock_guard slot_lock(it->second->mutex);
      it->second->position = p;
    }
  }
  position_ids_.reseed(p.id);

  std::cout << "[PositionLedger] hydrated position " << p.id << " owner="
            << p.owner << " " << p.pair << " status="
            << domain::toString(p.status) << "\n";
  publishUpdate(p, PositionChange::Hydrated);
}

bool PositionLedger::isTradable(const std::string& pair) const {
  return tradable_pairs_.empty() ||
         tradable_pairs_.count(PriceFeedAdapter::normalizeSymbol(pair)) > 0;
}

// -----------------------------------------------------------------------------
// mutate(): shared read-check-apply-commit path
// -----------------------------------------------------------------------------
// Cross siblings are snapshotted before the slot mutex is taken, so at most
// one slot mutex is held at a time.
// -----------------------------------------------------------------------------
domain::Result<domain::Position> PositionLedger::mutate(
    domain::PositionId id, std::uint64_t expected_version,
    PositionChange change, const Apply& apply,
    const AfterCommit& after_commit) {
  auto slot = findSlot(id);
  if (!slot) {
    return domain::ErrorCode::PositionNotFound;
  }

  const domain::Position before = copyOf(*slot);
  const bool cross = before.mode == domain::MarginMode::Cross;
  const auto siblings = cross ? openCrossSiblings(before.owner, id)
                              : std::vector<domain::Position>{};

  domain::Position after;
  {
    std::lock_guard lock(slot->mutex);
    domain::Position& stored = slot->position;
    if (auto err = checkMutable(stored, expected_version)) {
      return *err;
    }

    domain::Position candidate = stored;
    if (auto err = apply(candidate, siblings)) {
      return *err;
    }

    candidate.version = stored.version + 1;
    candidate.updated_at_ms = clock_.now_ms();
    stored = candidate;
    after = candidate;
  }

  publishUpdate(after, change);
  if (after_commit) {
    after_commit(after);
  }
  if (cross) {
    refreshCrossSiblings(after.owner, after.isOpen() ? after.id : 0);
  }
  return withMarks(after);
}

// -----------------------------------------------------------------------------
// Internal helpers
// -----------------------------------------------------------------------------
std::shared_ptr<PositionLedger::Slot> PositionLedger::findSlot(
    domain::PositionId id) const {
  std::shared_lock lock(table_mutex_);
  auto it = slots_.find(id);
  return it == slots_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<PositionLedger::Slot>> PositionLedger::ownerSlots(
    const domain::OwnerId& owner) const {
  std::shared_lock lock(table_mutex_);
  std::vector<std::shared_ptr<Slot>> out;
  auto it = by_owner_.find(owner);
  if (it == by_owner_.end()) {
    return out;
  }
  out.reserve(it->second.size());
  for (domain::PositionId id : it->second) {
    auto slot_it = slots_.find(id);
    if (slot_it != slots_.end()) {
      out.push_back(slot_it->second);
    }
  }
  return out;
}

domain::Position PositionLedger::copyOf(Slot& slot) {
  std::lock_guard lock(slot.mutex);
  return slot.position;
}

std::vector<domain::Position> PositionLedger::openCrossSiblings(
    const domain::OwnerId& owner, domain::PositionId exclude) const {
  std::vector<domain::Position> out;
  for (const auto& slot : ownerSlots(owner)) {
    domain::Position p = copyOf(*slot);
    if (p.id != exclude && p.isOpen() &&
        p.mode == domain::MarginMode::Cross) {
      out.push_back(std::move(p));
    }
  }
  std::sort(out.begin(), out.end(),
            [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

std::optional<domain::ErrorCode> PositionLedger::reprice(
    domain::Position& candidate,
    const std::vector<domain::Position>& siblings) const {
  MarginResult liq;
  if (candidate.mode == domain::MarginMode::Cross) {
    // Same id order as crossGroup(), so a recomputation from a group
    // snapshot sums in the same order and lands on the same value.
    std::vector<domain::Position> group = siblings;
    auto pos = std::lower_bound(
        group.begin(), group.end(), candidate.id,
        [](const domain::Position& p, domain::PositionId id) {
          return p.id < id;
        });
    group.insert(pos, candidate);
    liq = calculator_.crossLiquidationPrice(candidate, group);
  } else {
    liq = calculator_.liquidationPrice(candidate);
  }

  if (!liq.ok()) {
    std::cerr << "[PositionLedger] INTERNAL: cannot price position "
              << candidate.id << ": " << toString(liq.status) << "\n";
    return domain::ErrorCode::ComputationInvalid;
  }
  candidate.liquidation_price = liq.value;
  return std::nullopt;
}

domain::Result<double> PositionLedger::fillPrice(
    const std::string& pair, std::optional<double> explicit_price) const {
  if (explicit_price) {
    if (!isFinitePositive(*explicit_price)) {
      return domain::ErrorCode::InvalidRequest;
    }
    return *explicit_price;
  }
  const auto tick = prices_.latest(pair);
  if (!tick) {
    return domain::ErrorCode::PairUnavailable;
  }
  return tick->price;
}

// -----------------------------------------------------------------------------
// debitCrossPool()
// -----------------------------------------------------------------------------
// The new liquidation prices are computed from the group as it stands after
// the whole debit, so the follow-up refresh finds nothing left to reprice.
// -----------------------------------------------------------------------------
void PositionLedger::debitCrossPool(const domain::OwnerId& owner,
                                    double deficit) {
  std::vector<domain::Position> group = openCrossSiblings(owner, 0);
  double pool = 0.0;
  for (const auto& p : group) {
    pool += p.collateral;
  }
  if (!(pool > deficit)) {
    std::cerr << "[PositionLedger] INTERNAL: cross pool of owner " << owner
              << " shrank to " << pool << " before a debit of " << deficit
              << "\n";
    return;
  }

  std::unordered_map<domain::PositionId, double> shares;
  for (auto& p : group) {
    const double share = deficit * (p.collateral / pool);
    shares[p.id] = share;
    p.collateral -= share;
  }

  for (const auto& member : group) {
    auto slot = findSlot(member.id);
    if (!slot) {
      continue;
    }

    domain::Position updated;
    {
      std::lock_guard lock(slot->mutex);
      domain::Position& p = slot->position;
      if (!p.isOpen() || p.mode != domain::MarginMode::Cross) {
        continue;
      }
      p.collateral -= shares[p.id];
      const MarginResult liq = calculator_.crossLiquidationPrice(p, group);
      if (liq.ok()) {
        p.liquidation_price = liq.value;
      }
      ++p.version;
      p.updated_at_ms = clock_.now_ms();
      updated = p;
    }
    publishUpdate(updated, PositionChange::CollateralAdjusted);
  }

  std::cout << "[PositionLedger] cross group of owner " << owner
            << " absorbed " << deficit << " of a closed position's loss\n";
}

void PositionLedger::refreshCrossSiblings(const domain::OwnerId& owner,
                                          domain::PositionId exclude) {
  const std::vector<domain::Position> group = openCrossSiblings(owner, 0);

  for (const auto& member : group) {
    if (member.id == exclude) {
      continue;
    }
    auto slot = findSlot(member.id);
    if (!slot) {
      continue;
    }

    domain::Position updated;
    {
      std::lock_guard lock(slot->mutex);
      domain::Position& p = slot->position;
      if (!p.isOpen() || p.mode != domain::MarginMode::Cross) {
        continue;
      }
      const MarginResult liq = calculator_.crossLiquidationPrice(p, group);
      if (!liq.ok() || liq.value == p.liquidation_price) {
        continue;
      }
      p.liquidation_price = liq.value;
      updated = p;
    }
    publishUpdate(updated, PositionChange::Repriced);
  }
}

domain::LiquidationRecord PositionLedger::buildLiquidationRecord(
    const domain::Position& p, double mark_price, domain::LiquidationType type,
    std::int64_t now_ms) {
  const double loss =
      -MarginCalculator::unrealizedPnl(p, mark_price) + p.fees_outstanding;

  domain::LiquidationRecord r;
  r.id = history_.nextRecordId();
  r.position_id = p.id;
  r.owner = p.owner;
  r.pair = p.pair;
  r.side = p.side;
  r.leverage = p.leverage;
  r.entry_price = p.entry_price;
  r.liquidation_price = p.liquidation_price;
  r.mark_price = mark_price;
  r.size = p.size;
  r.collateral = p.collateral;
  r.loss_amount = loss;
  r.remaining_collateral = p.collateral - loss;
  r.mode = p.mode;
  r.type = type;
  r.liquidated_at_ms = now_ms;
  return r;
}

domain::Position PositionLedger::withMarks(domain::Position position) const {
  position.mark_price = 0.0;
  position.unrealized_pnl = 0.0;
  if (!position.isOpen()) {
    return position;
  }
  if (auto tick = prices_.latest(position.pair)) {
    position.mark_price = tick->price;
    position.unrealized_pnl =
        MarginCalculator::unrealizedPnl(position, tick->price);
  }
  return position;
}

void PositionLedger::publishUpdate(const domain::Position& position,
                                   PositionChange change) {
  PositionUpdateEvent event;
  event.position = withMarks(position);
  event.change = change;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  event.sequence_id = ++sequence_;
  bus_.publish(event);
}

void PositionLedger::publishLiquidation(
    const domain::LiquidationRecord& record) {
  LiquidationEvent event;
  event.record = record;
  event.timestamp = ms_to_timestamp(record.liquidated_at_ms);
  event.sequence_id = ++sequence_;
  bus_.publish(event);
}

}  // namespace margin
