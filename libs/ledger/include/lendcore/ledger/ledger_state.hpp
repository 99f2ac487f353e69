#pragma once

#include <array>
#include <cstddef>
#include <memory_resource>
#include <set>
#include <unordered_map>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/market.hpp"
#include "lendcore/ranking/ranking_heap.hpp"

namespace lendcore {
namespace ledger {

using AssetSet = std::set<common::AssetId>;

inline constexpr std::size_t kDefaultMaxSortedUsers = 16;

// Read access shared by the committed state and an open transaction.
class LedgerReader {
 public:
  virtual ~LedgerReader() = default;

  [[nodiscard]] virtual const Market* find_market(common::AssetId asset) const = 0;
  [[nodiscard]] virtual UserMarketBalance balance(common::AssetId asset, common::UserId user) const = 0;
  [[nodiscard]] virtual const AssetSet& collaterals(common::UserId user) const = 0;
  [[nodiscard]] virtual const AssetSet& borrowed(common::UserId user) const = 0;
};

// Registry of markets, user balances and per-user market sets. Mutated only
// through Transaction, except for market listing.
class LedgerState final : public LedgerReader {
 public:
  explicit LedgerState(std::size_t max_sorted_users = kDefaultMaxSortedUsers);

  LedgerState(const LedgerState&) = delete;
  LedgerState& operator=(const LedgerState&) = delete;

  // Lists `market`. Returns false and leaves the registry untouched when the
  // asset is already listed.
  bool create_market(const Market& market);

  [[nodiscard]] const Market* find_market(common::AssetId asset) const override;
  [[nodiscard]] UserMarketBalance balance(common::AssetId asset, common::UserId user) const override;
  [[nodiscard]] const AssetSet& collaterals(common::UserId user) const override;
  [[nodiscard]] const AssetSet& borrowed(common::UserId user) const override;

  [[nodiscard]] const ranking::RankingHeap& ranking(common::AssetId asset, Bucket bucket) const;
  [[nodiscard]] const std::vector<common::AssetId>& markets() const noexcept { return market_order_; }
  [[nodiscard]] std::size_t user_count(common::AssetId asset) const;

  [[nodiscard]] std::size_t max_sorted_users() const noexcept { return max_sorted_users_; }
  void set_max_sorted_users(std::size_t max_sorted_users);

 private:
  friend class Transaction;

  struct MarketBook {
    Market market{};
    std::unordered_map<common::UserId, UserMarketBalance> balances{};
    std::array<ranking::RankingHeap, kBucketCount> rankings{};
  };

  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_map<common::AssetId, MarketBook> books_;
  std::unordered_map<common::UserId, AssetSet> collaterals_{};
  std::unordered_map<common::UserId, AssetSet> borrowed_{};
  std::vector<common::AssetId> market_order_{};
  std::size_t max_sorted_users_;

  MarketBook& book(common::AssetId asset);
  const MarketBook* find_book(common::AssetId asset) const;
};

}  // namespace ledger
}  // namespace lendcore
