#include "lendcore/ledger/ledger_state.hpp"

#include <stdexcept>
#include <string>

namespace lendcore {
namespace ledger {

namespace {
const AssetSet kEmptySet{};
const ranking::RankingHeap kEmptyRanking{};
}  // namespace

LedgerState::LedgerState(std::size_t max_sorted_users)
    : arena_(1 << 16),
      books_(&arena_),
      max_sorted_users_(max_sorted_users) {
  if (max_sorted_users_ == 0) {
    throw std::invalid_argument("ledger: max sorted users must be positive");
  }
}

bool LedgerState::create_market(const Market& market) {
  auto [it, inserted] = books_.try_emplace(market.asset);
  if (!inserted) {
    return false;
  }
  it->second.market = market;
  it->second.market.is_created = true;
  market_order_.push_back(market.asset);
  return true;
}

const Market* LedgerState::find_market(common::AssetId asset) const {
  const auto* book = find_book(asset);
  return book ? &book->market : nullptr;
}

UserMarketBalance LedgerState::balance(common::AssetId asset, common::UserId user) const {
  const auto* book = find_book(asset);
  if (!book) {
    return {};
  }
  if (auto it = book->balances.find(user); it != book->balances.end()) {
    return it->second;
  }
  return {};
}

const AssetSet& LedgerState::collaterals(common::UserId user) const {
  if (auto it = collaterals_.find(user); it != collaterals_.end()) {
    return it->second;
  }
  return kEmptySet;
}

const AssetSet& LedgerState::borrowed(common::UserId user) const {
  if (auto it = borrowed_.find(user); it != borrowed_.end()) {
    return it->second;
  }
  return kEmptySet;
}

const ranking::RankingHeap& LedgerState::ranking(common::AssetId asset, Bucket bucket) const {
  const auto* book = find_book(asset);
  if (!book) {
    return kEmptyRanking;
  }
  return book->rankings[static_cast<std::size_t>(bucket)];
}

std::size_t LedgerState::user_count(common::AssetId asset) const {
  const auto* book = find_book(asset);
  return book ? book->balances.size() : 0;
}

void LedgerState::set_max_sorted_users(std::size_t max_sorted_users) {
  if (max_sorted_users == 0) {
    throw std::invalid_argument("ledger: max sorted users must be positive");
  }
  max_sorted_users_ = max_sorted_users;
}

LedgerState::MarketBook& LedgerState::book(common::AssetId asset) {
  auto it = books_.find(asset);
  if (it == books_.end()) {
    throw std::out_of_range("ledger: market " + std::to_string(asset) + " is not created");
  }
  return it->second;
}

const LedgerState::MarketBook* LedgerState::find_book(common::AssetId asset) const {
  auto it = books_.find(asset);
  if (it == books_.end()) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace ledger
}  // namespace lendcore
