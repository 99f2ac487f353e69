#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lendcore/auth/manager_registry.hpp"
#include "lendcore/common/errors.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/events/event_sink.hpp"
#include "lendcore/ledger/ledger_state.hpp"
#include "lendcore/ledger/market.hpp"
#include "lendcore/ledger/transaction.hpp"
#include "lendcore/matcher/matching_engine.hpp"
#include "lendcore/pool/pool.hpp"
#include "lendcore/positions/requests.hpp"
#include "lendcore/risk/liquidation_manager.hpp"
#include "lendcore/risk/risk_engine.hpp"

namespace lendcore {
namespace positions {

// Entry point of the optimizer. Owns the ledger and runs every flow inside a
// ledger::Transaction: bookkeeping first, then the queued pool calls, then the
// commit. Business failures come back as an Error in the result with no state
// change; a throwing pool call discards the transaction and propagates.
//
// Calls must be serialized by the caller.
class PositionsManager {
 public:
  PositionsManager(pool::Pool& pool,
                   const pool::PriceOracle& oracle,
                   const auth::PermissionResolver& permissions,
                   events::EventSink& sink,
                   ManagerConfig config = {});

  PositionsManager(const PositionsManager&) = delete;
  PositionsManager& operator=(const PositionsManager&) = delete;

  PositionResult supply(const SupplyRequest& request);
  PositionResult borrow(const BorrowRequest& request);
  PositionResult repay(const RepayRequest& request);
  PositionResult withdraw(const WithdrawRequest& request);
  CollateralResult supply_collateral(const CollateralRequest& request);
  CollateralResult withdraw_collateral(const CollateralRequest& request);
  LiquidationResult liquidate(const LiquidateRequest& request);

  // Market administration. Listing an asset twice is a no-op.
  common::Error create_market(common::AssetId asset,
                              common::BasisPoints reserve_factor,
                              common::BasisPoints p2p_index_cursor);
  common::Error set_is_supply_paused(common::AssetId asset, bool paused);
  common::Error set_is_borrow_paused(common::AssetId asset, bool paused);
  common::Error set_is_repay_paused(common::AssetId asset, bool paused);
  common::Error set_is_withdraw_paused(common::AssetId asset, bool paused);
  common::Error set_is_supply_collateral_paused(common::AssetId asset, bool paused);
  common::Error set_is_withdraw_collateral_paused(common::AssetId asset, bool paused);
  common::Error set_is_liquidate_collateral_paused(common::AssetId asset, bool paused);
  common::Error set_is_liquidate_borrow_paused(common::AssetId asset, bool paused);
  common::Error pause_all(common::AssetId asset, bool paused);
  common::Error set_is_collateral(common::AssetId asset, bool is_collateral);
  common::Error set_is_p2p_disabled(common::AssetId asset, bool disabled);
  // Requires borrowing to be paused.
  common::Error set_is_deprecated(common::AssetId asset, bool deprecated);
  common::Error set_reserve_factor(common::AssetId asset, common::BasisPoints reserve_factor);
  common::Error set_p2p_index_cursor(common::AssetId asset, common::BasisPoints p2p_index_cursor);
  void set_default_iterations(Iterations iterations) noexcept { config_.default_iterations = iterations; }
  void set_max_sorted_users(std::size_t max_sorted_users);

  // Brings the stored indexes of `asset` in line with the pool.
  common::Error update_indexes(common::AssetId asset);

  // Reads. Balances are in underlying units at the stored indexes.
  [[nodiscard]] const ledger::Market* market(common::AssetId asset) const { return ledger_.find_market(asset); }
  [[nodiscard]] ledger::UserMarketBalance scaled_balance(common::AssetId asset, common::UserId user) const {
    return ledger_.balance(asset, user);
  }
  [[nodiscard]] common::Amount supply_balance(common::AssetId asset, common::UserId user) const;
  [[nodiscard]] common::Amount borrow_balance(common::AssetId asset, common::UserId user) const;
  [[nodiscard]] common::Amount collateral_balance(common::AssetId asset, common::UserId user) const;
  [[nodiscard]] risk::LiquidityData liquidity_data(common::UserId user) const;
  [[nodiscard]] common::Amount health_factor(common::UserId user) const;

  [[nodiscard]] const ledger::LedgerState& ledger() const noexcept { return ledger_; }
  [[nodiscard]] const ManagerConfig& config() const noexcept { return config_; }

 private:
  enum class PoolAction : std::uint8_t {
    kSupply,
    kWithdraw,
    kBorrow,
    kRepay,
  };

  struct PendingCall {
    PoolAction action{PoolAction::kSupply};
    common::AssetId asset{common::kNoAsset};
    common::Amount amount{0};
  };

  // Side effects of a flow, released only once its bookkeeping is complete.
  struct Effects {
    std::vector<PendingCall> calls{};
    std::vector<events::Event> events{};

    void queue(PoolAction action, common::AssetId asset, const common::Amount& amount);
  };

  pool::Pool& pool_;
  const pool::PriceOracle& oracle_;
  const auth::PermissionResolver& permissions_;
  events::EventSink& sink_;
  ManagerConfig config_;

  ledger::LedgerState ledger_;
  matcher::MatchingEngine matcher_{};
  risk::RiskEngine risk_;
  risk::LiquidationManager liquidation_;

  [[nodiscard]] common::Error validate_input(common::UserId caller,
                                             common::AssetId asset,
                                             const common::Amount& amount,
                                             common::UserId on_behalf) const;
  [[nodiscard]] common::Error validate_manager_input(common::UserId caller,
                                                     common::AssetId asset,
                                                     const common::Amount& amount,
                                                     common::UserId on_behalf,
                                                     common::UserId receiver) const;

  void refresh_indexes(ledger::Transaction& tx, common::AssetId asset, Effects& effects) const;
  void refresh_account(ledger::Transaction& tx, common::UserId user, Effects& effects) const;

  PositionResult execute_supply(ledger::Transaction& tx, Effects& effects, common::UserId caller,
                                common::AssetId asset, const common::Amount& amount, common::UserId on_behalf,
                                std::size_t max_loops) const;
  PositionResult execute_borrow(ledger::Transaction& tx, Effects& effects, common::UserId caller,
                                common::AssetId asset, const common::Amount& amount, common::UserId on_behalf,
                                common::UserId receiver, std::size_t max_loops) const;
  PositionResult execute_repay(ledger::Transaction& tx, Effects& effects, common::UserId caller,
                               common::AssetId asset, const common::Amount& amount, common::UserId on_behalf,
                               std::size_t max_loops) const;
  PositionResult execute_withdraw(ledger::Transaction& tx, Effects& effects, common::UserId caller,
                                  common::AssetId asset, const common::Amount& amount, common::UserId on_behalf,
                                  common::UserId receiver, std::size_t max_loops) const;
  CollateralResult execute_supply_collateral(ledger::Transaction& tx, Effects& effects, common::UserId caller,
                                             common::AssetId asset, const common::Amount& amount,
                                             common::UserId on_behalf) const;
  CollateralResult execute_withdraw_collateral(ledger::Transaction& tx, Effects& effects, common::UserId caller,
                                               common::AssetId asset, const common::Amount& amount,
                                               common::UserId on_behalf, common::UserId receiver) const;

  void record_matches(Effects& effects, common::UserId actor, common::AssetId asset,
                      const matcher::MatchResult& match) const;
  void record_p2p_totals(Effects& effects, common::AssetId asset, const ledger::Market& market) const;

  // Replays the queued calls against the pool's reported totals, caps and
  // liquidity, and throws before the first call if any of them would be refused.
  void check_pool_calls(const Effects& effects) const;
  // Runs the queued pool calls, commits and publishes the events.
  void settle(ledger::Transaction& tx, Effects& effects);

  template <typename Mutation>
  common::Error update_market(common::AssetId asset, Mutation&& mutation);

  [[nodiscard]] static std::size_t loops_or(const std::optional<std::size_t>& requested, std::size_t fallback) {
    return requested.value_or(fallback);
  }
};

}  // namespace positions
}  // namespace lendcore
