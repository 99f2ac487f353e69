#include "lendcore/ledger/transaction.hpp"

#include <stdexcept>

namespace lendcore {
namespace ledger {

Transaction::Transaction(LedgerState& state) : state_(state) {}

Transaction::~Transaction() {
  if (open_) {
    rollback();
  }
}

const Market* Transaction::find_market(common::AssetId asset) const {
  if (auto it = markets_.find(asset); it != markets_.end()) {
    return &it->second;
  }
  return state_.find_market(asset);
}

UserMarketBalance Transaction::balance(common::AssetId asset, common::UserId user) const {
  if (auto it = balances_.find(BalanceKey{asset, user}); it != balances_.end()) {
    return it->second;
  }
  return state_.balance(asset, user);
}

const AssetSet& Transaction::collaterals(common::UserId user) const {
  if (auto it = collaterals_.find(user); it != collaterals_.end()) {
    return it->second;
  }
  return state_.collaterals(user);
}

const AssetSet& Transaction::borrowed(common::UserId user) const {
  if (auto it = borrowed_.find(user); it != borrowed_.end()) {
    return it->second;
  }
  return state_.borrowed(user);
}

Market& Transaction::market(common::AssetId asset) {
  if (!open_) {
    throw std::logic_error("transaction is closed");
  }
  auto it = markets_.find(asset);
  if (it == markets_.end()) {
    it = markets_.emplace(asset, state_.book(asset).market).first;
  }
  return it->second;
}

void Transaction::set_scaled(common::AssetId asset, common::UserId user, Bucket bucket, const common::Amount& value) {
  auto& staged = staged_balance(asset, user);
  common::Amount& slot = staged.of(bucket);
  if (slot == value) {
    return;
  }

  auto& heap = state_.book(asset).rankings[static_cast<std::size_t>(bucket)];
  ranking_journal_.try_emplace(RankingKey{asset, bucket, user}, heap.value_of(user));
  heap.update(user, slot, value, state_.max_sorted_users());

  const bool had_borrow = staged.has_borrow();
  slot = value;
  if (had_borrow != staged.has_borrow()) {
    auto& borrowed = staged_borrowed(user);
    if (staged.has_borrow()) {
      borrowed.insert(asset);
    } else {
      borrowed.erase(asset);
    }
  }
}

void Transaction::set_collateral(common::AssetId asset, common::UserId user, const common::Amount& value) {
  auto& staged = staged_balance(asset, user);
  const bool had_collateral = staged.scaled_collateral != 0;
  staged.scaled_collateral = value;
  if (had_collateral != (value != 0)) {
    auto& collaterals = staged_collaterals(user);
    if (value != 0) {
      collaterals.insert(asset);
    } else {
      collaterals.erase(asset);
    }
  }
}

const ranking::RankingHeap& Transaction::ranking(common::AssetId asset, Bucket bucket) const {
  return state_.ranking(asset, bucket);
}

void Transaction::commit() {
  if (!open_) {
    throw std::logic_error("transaction is closed");
  }

  for (auto& [asset, market] : markets_) {
    state_.book(asset).market = market;
  }
  for (auto& [key, staged] : balances_) {
    auto& balances = state_.book(key.first).balances;
    if (staged.is_zero()) {
      balances.erase(key.second);
    } else {
      balances[key.second] = staged;
    }
  }
  for (auto& [user, assets] : collaterals_) {
    if (assets.empty()) {
      state_.collaterals_.erase(user);
    } else {
      state_.collaterals_[user] = std::move(assets);
    }
  }
  for (auto& [user, assets] : borrowed_) {
    if (assets.empty()) {
      state_.borrowed_.erase(user);
    } else {
      state_.borrowed_[user] = std::move(assets);
    }
  }

  ranking_journal_.clear();
  open_ = false;
}

void Transaction::rollback() {
  for (const auto& [key, committed] : ranking_journal_) {
    const auto& [asset, bucket, user] = key;
    auto& heap = state_.book(asset).rankings[static_cast<std::size_t>(bucket)];
    heap.update(user, heap.value_of(user), committed, state_.max_sorted_users());
  }

  ranking_journal_.clear();
  markets_.clear();
  balances_.clear();
  collaterals_.clear();
  borrowed_.clear();
  open_ = false;
}

UserMarketBalance& Transaction::staged_balance(common::AssetId asset, common::UserId user) {
  if (!open_) {
    throw std::logic_error("transaction is closed");
  }
  if (user == common::kNoUser) {
    throw std::invalid_argument("transaction: balance of the zero user");
  }
  auto it = balances_.find(BalanceKey{asset, user});
  if (it == balances_.end()) {
    state_.book(asset);
    it = balances_.emplace(BalanceKey{asset, user}, state_.balance(asset, user)).first;
  }
  return it->second;
}

AssetSet& Transaction::staged_collaterals(common::UserId user) {
  auto it = collaterals_.find(user);
  if (it == collaterals_.end()) {
    it = collaterals_.emplace(user, state_.collaterals(user)).first;
  }
  return it->second;
}

AssetSet& Transaction::staged_borrowed(common::UserId user) {
  auto it = borrowed_.find(user);
  if (it == borrowed_.end()) {
    it = borrowed_.emplace(user, state_.borrowed(user)).first;
  }
  return it->second;
}

}  // namespace ledger
}  // namespace lendcore
