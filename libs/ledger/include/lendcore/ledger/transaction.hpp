#pragma once

#include <cstddef>
#include <map>
#include <tuple>
#include <unordered_map>
#include <utility>

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/ledger_state.hpp"
#include "lendcore/ledger/market.hpp"

namespace lendcore {
namespace ledger {

// Buffers every market, balance and market-set change of one operation.
//
// Reads see the buffered values. commit() publishes the buffer to the
// LedgerState; a transaction destroyed without commit() discards it. Rankings
// are derived from balances and are updated in place; the transaction keeps
// the committed value of each ranking entry it touched and restores it when
// the buffer is discarded.
class Transaction final : public LedgerReader {
 public:
  explicit Transaction(LedgerState& state);
  ~Transaction() override;

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  [[nodiscard]] const Market* find_market(common::AssetId asset) const override;
  [[nodiscard]] UserMarketBalance balance(common::AssetId asset, common::UserId user) const override;
  [[nodiscard]] const AssetSet& collaterals(common::UserId user) const override;
  [[nodiscard]] const AssetSet& borrowed(common::UserId user) const override;

  // Buffered copy of the market. Throws std::out_of_range if it is not created.
  [[nodiscard]] Market& market(common::AssetId asset);

  void set_scaled(common::AssetId asset, common::UserId user, Bucket bucket, const common::Amount& value);
  void set_collateral(common::AssetId asset, common::UserId user, const common::Amount& value);

  [[nodiscard]] const ranking::RankingHeap& ranking(common::AssetId asset, Bucket bucket) const;

  void commit();
  void rollback();
  [[nodiscard]] bool is_open() const noexcept { return open_; }

 private:
  using BalanceKey = std::pair<common::AssetId, common::UserId>;
  using RankingKey = std::tuple<common::AssetId, Bucket, common::UserId>;

  LedgerState& state_;
  std::unordered_map<common::AssetId, Market> markets_{};
  std::map<BalanceKey, UserMarketBalance> balances_{};
  std::unordered_map<common::UserId, AssetSet> collaterals_{};
  std::unordered_map<common::UserId, AssetSet> borrowed_{};
  std::map<RankingKey, common::Amount> ranking_journal_{};
  bool open_{true};

  UserMarketBalance& staged_balance(common::AssetId asset, common::UserId user);
  AssetSet& staged_collaterals(common::UserId user);
  AssetSet& staged_borrowed(common::UserId user);
};

}  // namespace ledger
}  // namespace lendcore
