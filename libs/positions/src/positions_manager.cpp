#include "lendcore/positions/positions_manager.hpp"

#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "lendcore/common/math.hpp"
#include "lendcore/delta/delta_accounting.hpp"
#include "lendcore/interest/index_engine.hpp"

namespace lendcore {
namespace positions {

namespace math = common::math;
using common::Amount;
using common::AssetId;
using common::Error;
using common::Side;
using common::UserId;
using events::Event;
using events::EventType;
using ledger::Bucket;

void PositionsManager::Effects::queue(PoolAction action, AssetId asset, const Amount& amount) {
  if (amount == 0) {
    return;
  }
  calls.push_back(PendingCall{.action = action, .asset = asset, .amount = amount});
}

PositionsManager::PositionsManager(pool::Pool& pool,
                                   const pool::PriceOracle& oracle,
                                   const auth::PermissionResolver& permissions,
                                   events::EventSink& sink,
                                   ManagerConfig config)
    : pool_(pool),
      oracle_(oracle),
      permissions_(permissions),
      sink_(sink),
      config_(config),
      ledger_(config.max_sorted_users),
      risk_(pool, oracle),
      liquidation_(risk_) {}

// Flows

PositionResult PositionsManager::supply(const SupplyRequest& request) {
  PositionResult result;
  result.error = validate_input(request.caller, request.asset, request.amount, request.on_behalf);
  if (result.ok() && ledger_.find_market(request.asset)->pause.is_supply_paused) {
    result.error = Error::kSupplyIsPaused;
  }
  if (!result.ok()) {
    return result;
  }

  ledger::Transaction tx(ledger_);
  Effects effects;
  refresh_indexes(tx, request.asset, effects);
  result = execute_supply(tx, effects, request.caller, request.asset, request.amount, request.on_behalf,
                          loops_or(request.max_loops, config_.default_iterations.supply));
  settle(tx, effects);
  return result;
}

PositionResult PositionsManager::borrow(const BorrowRequest& request) {
  PositionResult result;
  result.error =
      validate_manager_input(request.caller, request.asset, request.amount, request.on_behalf, request.receiver);
  if (!result.ok()) {
    return result;
  }

  if (ledger_.find_market(request.asset)->pause.is_borrow_paused) {
    result.error = Error::kBorrowIsPaused;
    return result;
  }

  const pool::ReserveConfiguration config = pool_.configuration(request.asset);
  if (!config.borrowing_enabled) {
    result.error = Error::kBorrowNotEnabled;
    return result;
  }
  if (config_.e_mode_category != 0 && config_.e_mode_category != config.e_mode_category) {
    result.error = Error::kInconsistentEMode;
    return result;
  }
  // The whole amount counts against the pool cap, even the share that will be
  // matched peer-to-peer and never reaches the pool.
  if (config.borrow_cap != 0 && pool_.total_borrow(request.asset) + request.amount > config.borrow_cap) {
    result.error = Error::kExceedsBorrowCap;
    return result;
  }
  if (!oracle_.is_borrow_allowed()) {
    result.error = Error::kSentinelBorrowNotEnabled;
    return result;
  }

  ledger::Transaction tx(ledger_);
  Effects effects;
  refresh_indexes(tx, request.asset, effects);
  refresh_account(tx, request.on_behalf, effects);

  result.error = risk_.authorize_borrow(tx, request.on_behalf, request.asset, request.amount);
  if (!result.ok()) {
    return result;
  }

  result = execute_borrow(tx, effects, request.caller, request.asset, request.amount, request.on_behalf,
                          request.receiver, loops_or(request.max_loops, config_.default_iterations.borrow));
  settle(tx, effects);
  return result;
}

PositionResult PositionsManager::repay(const RepayRequest& request) {
  PositionResult result;
  result.error = validate_input(request.caller, request.asset, request.amount, request.on_behalf);
  if (result.ok() && ledger_.find_market(request.asset)->pause.is_repay_paused) {
    result.error = Error::kRepayIsPaused;
  }
  if (!result.ok()) {
    return result;
  }

  ledger::Transaction tx(ledger_);
  Effects effects;
  refresh_indexes(tx, request.asset, effects);
  result = execute_repay(tx, effects, request.caller, request.asset, request.amount, request.on_behalf,
                         loops_or(request.max_loops, config_.default_iterations.repay));
  if (!result.ok()) {
    return result;
  }
  settle(tx, effects);
  return result;
}

PositionResult PositionsManager::withdraw(const WithdrawRequest& request) {
  PositionResult result;
  result.error =
      validate_manager_input(request.caller, request.asset, request.amount, request.on_behalf, request.receiver);
  if (result.ok() && ledger_.find_market(request.asset)->pause.is_withdraw_paused) {
    result.error = Error::kWithdrawIsPaused;
  }
  if (!result.ok()) {
    return result;
  }

  ledger::Transaction tx(ledger_);
  Effects effects;
  refresh_indexes(tx, request.asset, effects);
  result = execute_withdraw(tx, effects, request.caller, request.asset, request.amount, request.on_behalf,
                            request.receiver, loops_or(request.max_loops, config_.default_iterations.withdraw));
  if (!result.ok()) {
    return result;
  }
  settle(tx, effects);
  return result;
}

CollateralResult PositionsManager::supply_collateral(const CollateralRequest& request) {
  CollateralResult result;
  result.error = validate_input(request.caller, request.asset, request.amount, request.on_behalf);
  if (!result.ok()) {
    return result;
  }

  const ledger::Market* market = ledger_.find_market(request.asset);
  if (market->pause.is_supply_collateral_paused) {
    result.error = Error::kSupplyCollateralIsPaused;
    return result;
  }
  if (!market->is_collateral) {
    result.error = Error::kAssetNotCollateral;
    return result;
  }

  ledger::Transaction tx(ledger_);
  Effects effects;
  refresh_indexes(tx, request.asset, effects);
  result = execute_supply_collateral(tx, effects, request.caller, request.asset, request.amount, request.on_behalf);
  settle(tx, effects);
  return result;
}

CollateralResult PositionsManager::withdraw_collateral(const CollateralRequest& request) {
  CollateralResult result;
  result.error =
      validate_manager_input(request.caller, request.asset, request.amount, request.on_behalf, request.receiver);
  if (result.ok() && ledger_.find_market(request.asset)->pause.is_withdraw_collateral_paused) {
    result.error = Error::kWithdrawCollateralIsPaused;
  }
  if (!result.ok()) {
    return result;
  }

  ledger::Transaction tx(ledger_);
  Effects effects;
  refresh_indexes(tx, request.asset, effects);
  refresh_account(tx, request.on_behalf, effects);

  const Amount amount = math::min(request.amount, risk_.collateral_balance(tx, request.asset, request.on_behalf));
  if (amount == 0) {
    result.error = Error::kCollateralIsZero;
    return result;
  }

  result.error = risk_.authorize_withdraw_collateral(tx, request.on_behalf, request.asset, amount);
  if (!result.ok()) {
    return result;
  }

  result = execute_withdraw_collateral(tx, effects, request.caller, request.asset, amount, request.on_behalf,
                                       request.receiver);
  settle(tx, effects);
  return result;
}

LiquidationResult PositionsManager::liquidate(const LiquidateRequest& request) {
  LiquidationResult result;
  if (request.liquidator == common::kNoUser || request.borrower == common::kNoUser) {
    result.error = Error::kAddressIsZero;
    return result;
  }
  if (request.max_debt_to_cover == 0) {
    result.error = Error::kAmountIsZero;
    return result;
  }

  const ledger::Market* borrow_market = ledger_.find_market(request.borrow_asset);
  const ledger::Market* collateral_market = ledger_.find_market(request.collateral_asset);
  if (!borrow_market || !collateral_market) {
    result.error = Error::kMarketNotCreated;
    return result;
  }
  if (collateral_market->pause.is_liquidate_collateral_paused) {
    result.error = Error::kLiquidateCollateralIsPaused;
    return result;
  }
  if (borrow_market->pause.is_liquidate_borrow_paused) {
    result.error = Error::kLiquidateBorrowIsPaused;
    return result;
  }
  if (!collateral_market->is_collateral) {
    result.error = Error::kAssetNotCollateral;
    return result;
  }

  ledger::Transaction tx(ledger_);
  Effects effects;
  refresh_indexes(tx, request.borrow_asset, effects);
  refresh_indexes(tx, request.collateral_asset, effects);
  refresh_account(tx, request.borrower, effects);

  const auto authorization = liquidation_.authorize(tx, tx.market(request.borrow_asset), request.borrower);
  if (authorization.error != Error::kNone) {
    result.error = authorization.error;
    return result;
  }
  result.close_factor = authorization.close_factor;

  const Amount debt = risk_.borrow_balance(tx, request.borrow_asset, request.borrower);
  const Amount to_repay = math::min(math::percent_mul(debt, authorization.close_factor), request.max_debt_to_cover);
  if (to_repay == 0) {
    result.error = Error::kDebtIsZero;
    return result;
  }

  const Amount collateral = risk_.collateral_balance(tx, request.collateral_asset, request.borrower);
  if (collateral == 0) {
    result.error = Error::kCollateralIsZero;
    return result;
  }

  const auto amounts =
      liquidation_.seize_amounts(request.borrow_asset, request.collateral_asset, to_repay, collateral);
  if (amounts.repaid == 0 || amounts.seized == 0) {
    result.error = Error::kAmountIsZero;
    return result;
  }

  // Liquidations only break matches, they never search for new ones.
  const PositionResult repaid = execute_repay(tx, effects, request.liquidator, request.borrow_asset, amounts.repaid,
                                              request.borrower, 0);
  if (!repaid.ok()) {
    result.error = repaid.error;
    return result;
  }
  const CollateralResult seized = execute_withdraw_collateral(tx, effects, request.liquidator,
                                                              request.collateral_asset, amounts.seized,
                                                              request.borrower, request.liquidator);

  result.repaid = repaid.amount;
  result.seized = seized.amount;
  effects.events.push_back(Event{
      .type = EventType::kLiquidated,
      .actor = request.liquidator,
      .target = request.borrower,
      .asset = request.borrow_asset,
      .related_asset = request.collateral_asset,
      .amount = result.repaid,
      .related_amount = result.seized,
  });
  settle(tx, effects);
  return result;
}

// Administration

Error PositionsManager::create_market(AssetId asset,
                                      common::BasisPoints reserve_factor,
                                      common::BasisPoints p2p_index_cursor) {
  if (asset == common::kNoAsset) {
    return Error::kAddressIsZero;
  }
  if (reserve_factor > math::kPercentageFactor || p2p_index_cursor > math::kPercentageFactor) {
    return Error::kExceedsMaxBasisPoints;
  }
  if (ledger_.find_market(asset)) {
    return Error::kNone;
  }

  const pool::ReserveIndexes reserve = pool_.reserve_indexes(asset);
  ledger::Market market;
  market.asset = asset;
  market.indexes.supply = common::MarketSideIndexes{.pool_index = reserve.pool_supply_index, .p2p_index = math::kRay};
  market.indexes.borrow = common::MarketSideIndexes{.pool_index = reserve.pool_borrow_index, .p2p_index = math::kRay};
  market.reserve_factor = reserve_factor;
  market.p2p_index_cursor = p2p_index_cursor;
  ledger_.create_market(market);

  sink_.push(Event{.type = EventType::kMarketCreated, .asset = asset});
  return Error::kNone;
}

template <typename Mutation>
Error PositionsManager::update_market(AssetId asset, Mutation&& mutation) {
  if (!ledger_.find_market(asset)) {
    return Error::kMarketNotCreated;
  }

  ledger::Transaction tx(ledger_);
  const Error error = mutation(tx.market(asset));
  if (error != Error::kNone) {
    return error;
  }
  tx.commit();
  return Error::kNone;
}

Error PositionsManager::set_is_supply_paused(AssetId asset, bool paused) {
  return update_market(asset, [paused](ledger::Market& market) {
    market.pause.is_supply_paused = paused;
    return Error::kNone;
  });
}

Error PositionsManager::set_is_borrow_paused(AssetId asset, bool paused) {
  return update_market(asset, [paused](ledger::Market& market) {
    if (!paused && market.is_deprecated) {
      return Error::kMarketIsDeprecated;
    }
    market.pause.is_borrow_paused = paused;
    return Error::kNone;
  });
}

Error PositionsManager::set_is_repay_paused(AssetId asset, bool paused) {
  return update_market(asset, [paused](ledger::Market& market) {
    market.pause.is_repay_paused = paused;
    return Error::kNone;
  });
}

Error PositionsManager::set_is_withdraw_paused(AssetId asset, bool paused) {
  return update_market(asset, [paused](ledger::Market& market) {
    market.pause.is_withdraw_paused = paused;
    return Error::kNone;
  });
}

Error PositionsManager::set_is_supply_collateral_paused(AssetId asset, bool paused) {
  return update_market(asset, [paused](ledger::Market& market) {
    market.pause.is_supply_collateral_paused = paused;
    return Error::kNone;
  });
}

Error PositionsManager::set_is_withdraw_collateral_paused(AssetId asset, bool paused) {
  return update_market(asset, [paused](ledger::Market& market) {
    market.pause.is_withdraw_collateral_paused = paused;
    return Error::kNone;
  });
}

Error PositionsManager::set_is_liquidate_collateral_paused(AssetId asset, bool paused) {
  return update_market(asset, [paused](ledger::Market& market) {
    market.pause.is_liquidate_collateral_paused = paused;
    return Error::kNone;
  });
}

Error PositionsManager::set_is_liquidate_borrow_paused(AssetId asset, bool paused) {
  return update_market(asset, [paused](ledger::Market& market) {
    market.pause.is_liquidate_borrow_paused = paused;
    return Error::kNone;
  });
}

Error PositionsManager::pause_all(AssetId asset, bool paused) {
  return update_market(asset, [paused](ledger::Market& market) {
    market.pause = ledger::PauseStatuses{
        .is_supply_paused = paused,
        .is_borrow_paused = paused,
        .is_repay_paused = paused,
        .is_withdraw_paused = paused,
        .is_supply_collateral_paused = paused,
        .is_withdraw_collateral_paused = paused,
        .is_liquidate_collateral_paused = paused,
        .is_liquidate_borrow_paused = paused,
    };
    // Borrowing stays paused on a deprecated market.
    if (market.is_deprecated) {
      market.pause.is_borrow_paused = true;
    }
    return Error::kNone;
  });
}

Error PositionsManager::set_is_collateral(AssetId asset, bool is_collateral) {
  return update_market(asset, [is_collateral](ledger::Market& market) {
    market.is_collateral = is_collateral;
    return Error::kNone;
  });
}

Error PositionsManager::set_is_p2p_disabled(AssetId asset, bool disabled) {
  return update_market(asset, [disabled](ledger::Market& market) {
    market.is_p2p_disabled = disabled;
    return Error::kNone;
  });
}

Error PositionsManager::set_is_deprecated(AssetId asset, bool deprecated) {
  return update_market(asset, [deprecated](ledger::Market& market) {
    if (!market.pause.is_borrow_paused) {
      return Error::kBorrowNotPaused;
    }
    market.is_deprecated = deprecated;
    return Error::kNone;
  });
}

Error PositionsManager::set_reserve_factor(AssetId asset, common::BasisPoints reserve_factor) {
  if (reserve_factor > math::kPercentageFactor) {
    return Error::kExceedsMaxBasisPoints;
  }
  if (!ledger_.find_market(asset)) {
    return Error::kMarketNotCreated;
  }

  // Interest accrued so far is accounted at the previous factor.
  ledger::Transaction tx(ledger_);
  Effects effects;
  refresh_indexes(tx, asset, effects);
  tx.market(asset).reserve_factor = reserve_factor;
  settle(tx, effects);
  return Error::kNone;
}

Error PositionsManager::set_p2p_index_cursor(AssetId asset, common::BasisPoints p2p_index_cursor) {
  if (p2p_index_cursor > math::kPercentageFactor) {
    return Error::kExceedsMaxBasisPoints;
  }
  if (!ledger_.find_market(asset)) {
    return Error::kMarketNotCreated;
  }

  ledger::Transaction tx(ledger_);
  Effects effects;
  refresh_indexes(tx, asset, effects);
  tx.market(asset).p2p_index_cursor = p2p_index_cursor;
  settle(tx, effects);
  return Error::kNone;
}

void PositionsManager::set_max_sorted_users(std::size_t max_sorted_users) {
  ledger_.set_max_sorted_users(max_sorted_users);
  config_.max_sorted_users = max_sorted_users;
}

Error PositionsManager::update_indexes(AssetId asset) {
  if (!ledger_.find_market(asset)) {
    return Error::kMarketNotCreated;
  }

  ledger::Transaction tx(ledger_);
  Effects effects;
  refresh_indexes(tx, asset, effects);
  settle(tx, effects);
  return Error::kNone;
}

// Reads

Amount PositionsManager::supply_balance(AssetId asset, UserId user) const {
  return risk_.supply_balance(ledger_, asset, user);
}

Amount PositionsManager::borrow_balance(AssetId asset, UserId user) const {
  return risk_.borrow_balance(ledger_, asset, user);
}

Amount PositionsManager::collateral_balance(AssetId asset, UserId user) const {
  return risk_.collateral_balance(ledger_, asset, user);
}

risk::LiquidityData PositionsManager::liquidity_data(UserId user) const {
  return risk_.liquidity_data(ledger_, user);
}

Amount PositionsManager::health_factor(UserId user) const {
  return risk_.health_factor(ledger_, user);
}

// Validation

Error PositionsManager::validate_input(UserId caller, AssetId asset, const Amount& amount, UserId on_behalf) const {
  if (amount == 0) {
    return Error::kAmountIsZero;
  }
  if (caller == common::kNoUser || on_behalf == common::kNoUser) {
    return Error::kAddressIsZero;
  }
  const ledger::Market* market = ledger_.find_market(asset);
  if (!market || !market->is_created) {
    return Error::kMarketNotCreated;
  }
  return Error::kNone;
}

Error PositionsManager::validate_manager_input(UserId caller,
                                               AssetId asset,
                                               const Amount& amount,
                                               UserId on_behalf,
                                               UserId receiver) const {
  if (const Error error = validate_input(caller, asset, amount, on_behalf); error != Error::kNone) {
    return error;
  }
  if (receiver == common::kNoUser) {
    return Error::kAddressIsZero;
  }
  if (!permissions_.is_allowed(on_behalf, caller)) {
    return Error::kPermissionDenied;
  }
  return Error::kNone;
}

// Indexes

void PositionsManager::refresh_indexes(ledger::Transaction& tx, AssetId asset, Effects& effects) const {
  ledger::Market& market = tx.market(asset);
  const pool::ReserveIndexes reserve = pool_.reserve_indexes(asset);
  if (reserve.pool_supply_index == market.indexes.supply.pool_index &&
      reserve.pool_borrow_index == market.indexes.borrow.pool_index) {
    return;
  }

  market.indexes = interest::compute_indexes(interest::IndexesParams{
      .last = market.indexes,
      .pool_supply_index = reserve.pool_supply_index,
      .pool_borrow_index = reserve.pool_borrow_index,
      .deltas = market.deltas,
      .proportion_idle =
          interest::proportion_idle(market.idle_supply, market.deltas.supply, market.indexes.supply.p2p_index),
      .reserve_factor = market.reserve_factor,
      .p2p_index_cursor = market.p2p_index_cursor,
  });

  effects.events.push_back(Event{
      .type = EventType::kIndexesUpdated,
      .asset = asset,
      .on_pool = market.indexes.supply.p2p_index,
      .in_p2p = market.indexes.borrow.p2p_index,
  });
}

void PositionsManager::refresh_account(ledger::Transaction& tx, UserId user, Effects& effects) const {
  ledger::AssetSet assets = tx.collaterals(user);
  const ledger::AssetSet& borrowed = tx.borrowed(user);
  assets.insert(borrowed.begin(), borrowed.end());
  for (const AssetId asset : assets) {
    refresh_indexes(tx, asset, effects);
  }
}

// Execution steps. Validation is done by the caller.

PositionResult PositionsManager::execute_supply(ledger::Transaction& tx,
                                                Effects& effects,
                                                UserId caller,
                                                AssetId asset,
                                                const Amount& amount,
                                                UserId on_behalf,
                                                std::size_t max_loops) const {
  ledger::Market& market = tx.market(asset);
  const common::Indexes indexes = market.indexes;
  PositionResult result;
  result.amount = amount;

  // Supply that backs peer-to-peer borrows sitting on the pool is matched first.
  const delta::DecreaseResult from_delta = delta::decrease_delta(market.deltas.borrow, amount,
                                                                 indexes.borrow.pool_index);
  Amount to_repay = from_delta.consumed;
  Amount remaining = from_delta.remainder;

  const matcher::MatchResult promoted = matcher_.promote(tx, asset, Side::kBorrow, remaining, max_loops);
  record_matches(effects, caller, asset, promoted);
  to_repay += promoted.matched;
  remaining -= promoted.matched;

  const ledger::UserMarketBalance balance = tx.balance(asset, on_behalf);
  result.in_p2p = balance.scaled_p2p_supply +
                  delta::increase_p2p(market.deltas, promoted.matched, to_repay, indexes, Side::kSupply);
  result.on_pool = balance.scaled_pool_supply + delta::scale_credit(remaining, indexes.supply.pool_index);
  tx.set_scaled(asset, on_behalf, Bucket::kPoolSupply, result.on_pool);
  tx.set_scaled(asset, on_behalf, Bucket::kP2PSupply, result.in_p2p);

  if (to_repay != 0) {
    record_p2p_totals(effects, asset, market);
  }

  effects.queue(PoolAction::kRepay, asset, to_repay);
  effects.queue(PoolAction::kSupply, asset, remaining);

  result.split = Split{.pool = remaining, .p2p = promoted.matched, .delta = from_delta.consumed, .idle = 0};
  result.loops = promoted.loops;
  effects.events.push_back(Event{
      .type = EventType::kSupplied,
      .actor = caller,
      .target = on_behalf,
      .asset = asset,
      .amount = amount,
      .on_pool = result.on_pool,
      .in_p2p = result.in_p2p,
      .side = Side::kSupply,
  });
  return result;
}

PositionResult PositionsManager::execute_borrow(ledger::Transaction& tx,
                                                Effects& effects,
                                                UserId caller,
                                                AssetId asset,
                                                const Amount& amount,
                                                UserId on_behalf,
                                                UserId receiver,
                                                std::size_t max_loops) const {
  ledger::Market& market = tx.market(asset);
  const common::Indexes indexes = market.indexes;
  PositionResult result;
  result.amount = amount;

  // Idle supply is lent out before the supply delta.
  const Amount matched_idle = math::min(market.idle_supply, amount);
  Amount remaining = amount - matched_idle;
  if (matched_idle != 0) {
    market.idle_supply -= matched_idle;
    effects.events.push_back(Event{.type = EventType::kIdleSupplyUpdated, .asset = asset, .amount = market.idle_supply});
  }

  const delta::DecreaseResult from_delta = delta::decrease_delta(market.deltas.supply, remaining,
                                                                 indexes.supply.pool_index);
  Amount to_withdraw = from_delta.consumed;
  remaining = from_delta.remainder;

  const matcher::MatchResult promoted = matcher_.promote(tx, asset, Side::kSupply, remaining, max_loops);
  record_matches(effects, caller, asset, promoted);
  to_withdraw += promoted.matched;
  remaining -= promoted.matched;

  const ledger::UserMarketBalance balance = tx.balance(asset, on_behalf);
  result.in_p2p = balance.scaled_p2p_borrow + delta::increase_p2p(market.deltas, promoted.matched,
                                                                  to_withdraw + matched_idle, indexes, Side::kBorrow);
  result.on_pool = balance.scaled_pool_borrow + delta::scale_credit(remaining, indexes.borrow.pool_index);
  tx.set_scaled(asset, on_behalf, Bucket::kPoolBorrow, result.on_pool);
  tx.set_scaled(asset, on_behalf, Bucket::kP2PBorrow, result.in_p2p);

  if (to_withdraw + matched_idle != 0) {
    record_p2p_totals(effects, asset, market);
  }

  effects.queue(PoolAction::kWithdraw, asset, to_withdraw);
  effects.queue(PoolAction::kBorrow, asset, remaining);

  result.split =
      Split{.pool = remaining, .p2p = promoted.matched, .delta = from_delta.consumed, .idle = matched_idle};
  result.loops = promoted.loops;
  effects.events.push_back(Event{
      .type = EventType::kBorrowed,
      .actor = caller,
      .target = on_behalf,
      .counterparty = receiver,
      .asset = asset,
      .amount = amount,
      .on_pool = result.on_pool,
      .in_p2p = result.in_p2p,
      .side = Side::kBorrow,
  });
  return result;
}

PositionResult PositionsManager::execute_repay(ledger::Transaction& tx,
                                               Effects& effects,
                                               UserId caller,
                                               AssetId asset,
                                               const Amount& amount,
                                               UserId on_behalf,
                                               std::size_t max_loops) const {
  ledger::Market& market = tx.market(asset);
  const common::Indexes indexes = market.indexes;
  const ledger::UserMarketBalance balance = tx.balance(asset, on_behalf);
  PositionResult result;

  const Amount pool_debt = delta::unscale(balance.scaled_pool_borrow, indexes.borrow.pool_index, Side::kBorrow);
  const Amount p2p_debt = delta::unscale(balance.scaled_p2p_borrow, indexes.borrow.p2p_index, Side::kBorrow);
  const Amount repaid = math::min(amount, pool_debt + p2p_debt);
  if (repaid == 0) {
    result.error = Error::kDebtIsZero;
    return result;
  }
  result.amount = repaid;

  // The pool part of the debt goes first, then the peer-to-peer part.
  const Amount from_pool = math::min(pool_debt, repaid);
  Amount remaining = repaid - from_pool;
  result.on_pool =
      math::zero_floor_sub(balance.scaled_pool_borrow, delta::scale_debit(from_pool, indexes.borrow.pool_index));
  result.in_p2p =
      math::zero_floor_sub(balance.scaled_p2p_borrow, delta::scale_debit(remaining, indexes.borrow.p2p_index));
  tx.set_scaled(asset, on_behalf, Bucket::kPoolBorrow, result.on_pool);
  tx.set_scaled(asset, on_behalf, Bucket::kP2PBorrow, result.in_p2p);
  result.split.pool = from_pool;

  Amount to_repay = from_pool;
  Amount to_supply = 0;

  if (remaining != 0) {
    const delta::DecreaseResult from_delta = delta::decrease_delta(market.deltas.borrow, remaining,
                                                                   indexes.borrow.pool_index);
    to_repay += from_delta.consumed;
    remaining = from_delta.remainder;
    result.split.delta = from_delta.consumed;
    // The consumed delta leaves the peer-to-peer borrow volume before the fee
    // is measured against it.
    delta::decrease_p2p(market.deltas, 0, from_delta.consumed, indexes, Side::kBorrow);

    const Amount after_fee = delta::repay_fee(market.deltas, remaining, indexes, market.idle_supply);
    result.split.p2p = remaining - after_fee;
    remaining = after_fee;

    // Other pool borrowers take over the matched supply.
    const matcher::MatchResult promoted = matcher_.promote(tx, asset, Side::kBorrow, remaining, max_loops);
    record_matches(effects, caller, asset, promoted);
    to_repay += promoted.matched;
    remaining -= promoted.matched;
    result.split.p2p += promoted.matched;
    result.loops = promoted.loops;

    // What the pool cannot take because of its supply cap stays idle.
    const pool::ReserveConfiguration config = pool_.configuration(asset);
    const Amount room =
        config.supply_cap == 0 ? remaining : math::zero_floor_sub(config.supply_cap, pool_.total_supply(asset));
    to_supply = math::min(remaining, room);

    const matcher::MatchResult demoted =
        matcher_.demote(tx, asset, Side::kSupply, to_supply, max_loops - promoted.loops);
    record_matches(effects, caller, asset, demoted);
    result.split.p2p += demoted.matched;
    result.loops += demoted.loops;

    const Amount undemoted = to_supply - demoted.matched;
    delta::increase_delta(market.deltas.supply, undemoted, indexes.supply);
    result.split.delta += undemoted;

    const Amount idle = remaining - to_supply;
    if (idle != 0) {
      market.idle_supply += idle;
      effects.events.push_back(
          Event{.type = EventType::kIdleSupplyUpdated, .asset = asset, .amount = market.idle_supply});
    }
    result.split.idle = idle;

    delta::decrease_p2p(market.deltas, demoted.matched, remaining, indexes, Side::kBorrow);
    record_p2p_totals(effects, asset, market);
  }

  effects.queue(PoolAction::kRepay, asset, to_repay);
  effects.queue(PoolAction::kSupply, asset, to_supply);

  effects.events.push_back(Event{
      .type = EventType::kRepaid,
      .actor = caller,
      .target = on_behalf,
      .asset = asset,
      .amount = repaid,
      .on_pool = result.on_pool,
      .in_p2p = result.in_p2p,
      .side = Side::kBorrow,
  });
  return result;
}

PositionResult PositionsManager::execute_withdraw(ledger::Transaction& tx,
                                                  Effects& effects,
                                                  UserId caller,
                                                  AssetId asset,
                                                  const Amount& amount,
                                                  UserId on_behalf,
                                                  UserId receiver,
                                                  std::size_t max_loops) const {
  ledger::Market& market = tx.market(asset);
  const common::Indexes indexes = market.indexes;
  const ledger::UserMarketBalance balance = tx.balance(asset, on_behalf);
  PositionResult result;

  const Amount pool_supply = delta::unscale(balance.scaled_pool_supply, indexes.supply.pool_index, Side::kSupply);
  const Amount p2p_supply = delta::unscale(balance.scaled_p2p_supply, indexes.supply.p2p_index, Side::kSupply);
  const Amount withdrawn = math::min(amount, pool_supply + p2p_supply);
  if (withdrawn == 0) {
    result.error = Error::kSupplyIsZero;
    return result;
  }
  result.amount = withdrawn;

  const Amount from_pool = math::min(pool_supply, withdrawn);
  Amount remaining = withdrawn - from_pool;
  result.on_pool =
      math::zero_floor_sub(balance.scaled_pool_supply, delta::scale_debit(from_pool, indexes.supply.pool_index));
  result.in_p2p =
      math::zero_floor_sub(balance.scaled_p2p_supply, delta::scale_debit(remaining, indexes.supply.p2p_index));
  tx.set_scaled(asset, on_behalf, Bucket::kPoolSupply, result.on_pool);
  tx.set_scaled(asset, on_behalf, Bucket::kP2PSupply, result.in_p2p);
  result.split.pool = from_pool;

  Amount to_withdraw = from_pool;
  Amount to_borrow = 0;

  if (remaining != 0) {
    const Amount matched_idle = math::min(market.idle_supply, remaining);
    remaining -= matched_idle;
    if (matched_idle != 0) {
      market.idle_supply -= matched_idle;
      effects.events.push_back(
          Event{.type = EventType::kIdleSupplyUpdated, .asset = asset, .amount = market.idle_supply});
    }
    result.split.idle = matched_idle;

    const delta::DecreaseResult from_delta = delta::decrease_delta(market.deltas.supply, remaining,
                                                                   indexes.supply.pool_index);
    to_withdraw += from_delta.consumed;
    remaining = from_delta.remainder;
    result.split.delta = from_delta.consumed;

    // Other pool suppliers take over the matched borrow.
    const matcher::MatchResult promoted = matcher_.promote(tx, asset, Side::kSupply, remaining, max_loops);
    record_matches(effects, caller, asset, promoted);
    to_withdraw += promoted.matched;
    remaining -= promoted.matched;
    result.split.p2p = promoted.matched;
    result.loops = promoted.loops;

    // The rest is borrowed from the pool: for demoted borrowers on their own
    // behalf, for the others as a borrow delta.
    const matcher::MatchResult demoted =
        matcher_.demote(tx, asset, Side::kBorrow, remaining, max_loops - promoted.loops);
    record_matches(effects, caller, asset, demoted);
    result.split.p2p += demoted.matched;
    result.loops += demoted.loops;

    const Amount undemoted = remaining - demoted.matched;
    delta::increase_delta(market.deltas.borrow, undemoted, indexes.borrow);
    result.split.delta += undemoted;

    delta::decrease_p2p(market.deltas, demoted.matched, matched_idle + from_delta.consumed + remaining, indexes,
                        Side::kSupply);
    record_p2p_totals(effects, asset, market);
    to_borrow = remaining;
  }

  effects.queue(PoolAction::kWithdraw, asset, to_withdraw);
  effects.queue(PoolAction::kBorrow, asset, to_borrow);

  effects.events.push_back(Event{
      .type = EventType::kWithdrawn,
      .actor = caller,
      .target = on_behalf,
      .counterparty = receiver,
      .asset = asset,
      .amount = withdrawn,
      .on_pool = result.on_pool,
      .in_p2p = result.in_p2p,
      .side = Side::kSupply,
  });
  return result;
}

CollateralResult PositionsManager::execute_supply_collateral(ledger::Transaction& tx,
                                                             Effects& effects,
                                                             UserId caller,
                                                             AssetId asset,
                                                             const Amount& amount,
                                                             UserId on_behalf) const {
  const common::Amount& pool_index = tx.market(asset).indexes.supply.pool_index;
  CollateralResult result;
  result.amount = amount;
  result.scaled_collateral = tx.balance(asset, on_behalf).scaled_collateral + delta::scale_credit(amount, pool_index);
  tx.set_collateral(asset, on_behalf, result.scaled_collateral);

  effects.queue(PoolAction::kSupply, asset, amount);
  effects.events.push_back(Event{
      .type = EventType::kCollateralSupplied,
      .actor = caller,
      .target = on_behalf,
      .asset = asset,
      .amount = amount,
      .on_pool = result.scaled_collateral,
  });
  return result;
}

CollateralResult PositionsManager::execute_withdraw_collateral(ledger::Transaction& tx,
                                                               Effects& effects,
                                                               UserId caller,
                                                               AssetId asset,
                                                               const Amount& amount,
                                                               UserId on_behalf,
                                                               UserId receiver) const {
  const common::Amount& pool_index = tx.market(asset).indexes.supply.pool_index;
  CollateralResult result;
  result.amount = amount;
  result.scaled_collateral = math::zero_floor_sub(tx.balance(asset, on_behalf).scaled_collateral,
                                                  delta::scale_debit(amount, pool_index));
  tx.set_collateral(asset, on_behalf, result.scaled_collateral);

  effects.queue(PoolAction::kWithdraw, asset, amount);
  effects.events.push_back(Event{
      .type = EventType::kCollateralWithdrawn,
      .actor = caller,
      .target = on_behalf,
      .counterparty = receiver,
      .asset = asset,
      .amount = amount,
      .on_pool = result.scaled_collateral,
  });
  return result;
}

// Effects

void PositionsManager::record_matches(Effects& effects,
                                      UserId actor,
                                      AssetId asset,
                                      const matcher::MatchResult& match) const {
  for (const auto& update : match.updates) {
    effects.events.push_back(Event{
        .type = EventType::kPositionUpdated,
        .actor = actor,
        .target = update.user,
        .asset = asset,
        .on_pool = update.on_pool,
        .in_p2p = update.in_p2p,
        .side = update.side,
    });
  }
}

void PositionsManager::record_p2p_totals(Effects& effects, AssetId asset, const ledger::Market& market) const {
  effects.events.push_back(Event{
      .type = EventType::kP2PTotalsUpdated,
      .asset = asset,
      .on_pool = market.deltas.supply.scaled_p2p_total,
      .in_p2p = market.deltas.borrow.scaled_p2p_total,
  });
}

void PositionsManager::check_pool_calls(const Effects& effects) const {
  struct Projection {
    pool::ReserveConfiguration config{};
    Amount supply{0};
    Amount borrow{0};
  };
  std::unordered_map<AssetId, Projection> projected;

  for (const PendingCall& call : effects.calls) {
    auto [it, inserted] = projected.try_emplace(call.asset);
    Projection& reserve = it->second;
    if (inserted) {
      reserve.config = pool_.configuration(call.asset);
      reserve.supply = pool_.total_supply(call.asset);
      reserve.borrow = pool_.total_borrow(call.asset);
    }

    switch (call.action) {
      case PoolAction::kSupply:
        if (reserve.config.supply_cap != 0 && reserve.supply + call.amount > reserve.config.supply_cap) {
          throw std::runtime_error("pool: supply cap exceeded");
        }
        reserve.supply += call.amount;
        break;
      case PoolAction::kWithdraw:
        if (math::zero_floor_sub(reserve.supply, call.amount) < reserve.borrow) {
          throw std::runtime_error("pool: not enough liquidity to withdraw");
        }
        reserve.supply = math::zero_floor_sub(reserve.supply, call.amount);
        break;
      case PoolAction::kBorrow:
        if (!reserve.config.borrowing_enabled) {
          throw std::runtime_error("pool: borrowing disabled");
        }
        if (reserve.config.borrow_cap != 0 && reserve.borrow + call.amount > reserve.config.borrow_cap) {
          throw std::runtime_error("pool: borrow cap exceeded");
        }
        if (reserve.borrow + call.amount > reserve.supply) {
          throw std::runtime_error("pool: not enough liquidity to borrow");
        }
        reserve.borrow += call.amount;
        break;
      case PoolAction::kRepay:
        reserve.borrow = math::zero_floor_sub(reserve.borrow, call.amount);
        break;
    }
  }
}

void PositionsManager::settle(ledger::Transaction& tx, Effects& effects) {
  check_pool_calls(effects);
  for (const PendingCall& call : effects.calls) {
    switch (call.action) {
      case PoolAction::kSupply:
        pool_.supply(call.asset, call.amount);
        break;
      case PoolAction::kWithdraw:
        pool_.withdraw(call.asset, call.amount);
        break;
      case PoolAction::kBorrow:
        pool_.borrow(call.asset, call.amount);
        break;
      case PoolAction::kRepay:
        pool_.repay(call.asset, call.amount);
        break;
    }
  }

  tx.commit();
  sink_.push_all(std::move(effects.events));
  effects.calls.clear();
}

}  // namespace positions
}  // namespace lendcore
