#include "test_positions.hpp"

#include <cassert>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "lendcore/auth/manager_registry.hpp"
#include "lendcore/common/math.hpp"
#include "lendcore/events/event_sink.hpp"
#include "lendcore/pool/simulated_pool.hpp"
#include "lendcore/positions/positions_manager.hpp"
#include "lendcore/risk/liquidation_manager.hpp"

namespace lendcore::tests {

namespace math = common::math;
using common::Amount;
using common::Error;
using common::UserId;
using events::EventType;
using ledger::Bucket;
using positions::PositionResult;

namespace {

constexpr common::AssetId kDai = 1;
constexpr common::AssetId kEth = 2;

pool::ReserveConfiguration default_reserve() {
  return pool::ReserveConfiguration{
      .decimals = 0,
      .ltv = 8'000,
      .liquidation_threshold = 8'500,
      .liquidation_bonus = 10'500,
  };
}

// Two markets priced 1:1 with whole-unit tokens: DAI is borrowed, ETH backs it.
struct Fixture {
  pool::SimulatedPool pool;
  pool::StaticPriceOracle oracle;
  auth::ManagerRegistry registry;
  events::EventSink sink;
  positions::PositionsManager manager;

  explicit Fixture(const Amount& dai_liquidity = 1'000'000, positions::ManagerConfig config = {})
      : manager(pool, oracle, registry, sink, config) {
    list(kDai, dai_liquidity);
    list(kEth, 1'000'000);
  }

  void list(common::AssetId asset, const Amount& liquidity) {
    pool.list_reserve(asset, default_reserve(),
                      pool::ReserveIndexes{.pool_supply_index = math::kRay, .pool_borrow_index = math::kRay});
    pool.seed_liquidity(asset, liquidity);
    oracle.set_price(asset, 1);
    const Error created = manager.create_market(asset, 0, 5'000);
    assert(created == Error::kNone);
    const Error collateral = manager.set_is_collateral(asset, true);
    assert(collateral == Error::kNone);
  }

  void set_dai_indexes(const Amount& supply_index, const Amount& borrow_index) {
    pool.set_indexes(kDai, pool::ReserveIndexes{.pool_supply_index = supply_index, .pool_borrow_index = borrow_index});
  }

  PositionResult supply(UserId user, const Amount& amount, std::optional<std::size_t> loops = std::nullopt) {
    return manager.supply({.caller = user, .asset = kDai, .amount = amount, .on_behalf = user, .max_loops = loops});
  }

  PositionResult borrow(UserId user, const Amount& amount, std::optional<std::size_t> loops = std::nullopt) {
    return manager.borrow(
        {.caller = user, .asset = kDai, .amount = amount, .on_behalf = user, .receiver = user, .max_loops = loops});
  }

  PositionResult repay(UserId user, const Amount& amount, std::optional<std::size_t> loops = std::nullopt) {
    return manager.repay({.caller = user, .asset = kDai, .amount = amount, .on_behalf = user, .max_loops = loops});
  }

  PositionResult withdraw(UserId user, const Amount& amount, std::optional<std::size_t> loops = std::nullopt) {
    return manager.withdraw(
        {.caller = user, .asset = kDai, .amount = amount, .on_behalf = user, .receiver = user, .max_loops = loops});
  }

  positions::CollateralResult post_collateral(UserId user, const Amount& amount) {
    return manager.supply_collateral({.caller = user, .asset = kEth, .amount = amount, .on_behalf = user});
  }

  positions::LiquidationResult liquidate(UserId liquidator, UserId borrower, const Amount& max_debt) {
    return manager.liquidate({.liquidator = liquidator,
                              .borrow_asset = kDai,
                              .collateral_asset = kEth,
                              .borrower = borrower,
                              .max_debt_to_cover = max_debt});
  }

  const ledger::Market& dai() const { return *manager.market(kDai); }
};

Amount ray_percent(unsigned percent) {
  return math::kRay * percent / 100;
}

void check_split(const PositionResult& result, std::size_t max_loops) {
  assert(result.ok());
  assert(result.split.total() == result.amount);
  assert(result.loops <= max_loops);
}

// Matched supply net of the supply delta and idle supply equals matched debt
// net of the borrow delta, and the per-user scaled P2P balances add up to the
// market totals. Exact while every index is RAY.
void check_p2p_volumes(const Fixture& fixture, UserId first, UserId last) {
  const auto& market = fixture.dai();
  const auto& supply = market.deltas.supply;
  const auto& borrow = market.deltas.borrow;
  assert(supply.scaled_p2p_total + borrow.scaled_delta ==
         borrow.scaled_p2p_total + supply.scaled_delta + market.idle_supply);

  Amount supplied = 0;
  Amount borrowed = 0;
  for (UserId user = first; user <= last; ++user) {
    const auto balance = fixture.manager.scaled_balance(kDai, user);
    supplied += balance.scaled_p2p_supply;
    borrowed += balance.scaled_p2p_borrow;
  }
  assert(supplied == supply.scaled_p2p_total);
  assert(borrowed == borrow.scaled_p2p_total);
}

}  // namespace

void test_supply_to_pool() {
  Fixture fixture;

  const auto result = fixture.supply(1, 1'000);
  assert(result.ok());
  assert(result.amount == 1'000);
  assert(result.on_pool == 1'000);
  assert(result.in_p2p == 0);
  assert(result.split.pool == 1'000);
  assert(result.loops == 0);

  const auto& market = fixture.dai();
  assert(market.deltas.supply.scaled_delta == 0);
  assert(market.deltas.borrow.scaled_delta == 0);
  assert(market.deltas.supply.scaled_p2p_total == 0);
  assert(market.idle_supply == 0);

  assert(fixture.pool.supplied_by_optimizer(kDai) == 1'000);
  assert(fixture.manager.supply_balance(kDai, 1) == 1'000);
  assert(fixture.manager.ledger().ranking(kDai, Bucket::kPoolSupply).head() == 1);

  // Anyone may supply on behalf of another user.
  const auto gifted = fixture.manager.supply({.caller = 5, .asset = kDai, .amount = 10, .on_behalf = 1});
  assert(gifted.ok());
  assert(fixture.manager.supply_balance(kDai, 1) == 1'010);
  assert(fixture.manager.supply_balance(kDai, 5) == 0);
}

void test_full_repay_with_matched_supplier() {
  Fixture fixture;

  assert(fixture.supply(1, 500).ok());
  assert(fixture.post_collateral(2, 10'000).ok());

  const auto borrowed = fixture.borrow(2, 500);
  assert(borrowed.ok());
  assert(borrowed.in_p2p == 500);
  assert(borrowed.on_pool == 0);
  assert(borrowed.split.p2p == 500);
  assert(borrowed.loops == 1);

  auto supplier = fixture.manager.scaled_balance(kDai, 1);
  assert(supplier.scaled_pool_supply == 0);
  assert(supplier.scaled_p2p_supply == 500);
  assert(fixture.dai().deltas.supply.scaled_p2p_total == 500);
  assert(fixture.dai().deltas.borrow.scaled_p2p_total == 500);
  assert(fixture.pool.supplied_by_optimizer(kDai) == 0);
  assert(fixture.pool.borrowed_by_optimizer(kDai) == 0);

  fixture.pool.clear_calls();
  const auto repaid = fixture.repay(2, 500);
  assert(repaid.ok());
  assert(repaid.amount == 500);
  assert(repaid.on_pool == 0);
  assert(repaid.in_p2p == 0);
  assert(repaid.split.p2p == 500);
  assert(repaid.split.total() == 500);

  // The supplier is demoted back to the pool and both totals drop by 500.
  supplier = fixture.manager.scaled_balance(kDai, 1);
  assert(supplier.scaled_pool_supply == 500);
  assert(supplier.scaled_p2p_supply == 0);
  assert(fixture.dai().deltas.supply.scaled_p2p_total == 0);
  assert(fixture.dai().deltas.borrow.scaled_p2p_total == 0);

  const auto& calls = fixture.pool.calls();
  assert(calls.size() == 1);
  assert(calls[0].action == pool::SimulatedPool::Action::kSupply);
  assert(calls[0].amount == 500);
  assert(fixture.manager.ledger().borrowed(2).empty());
}

void test_delta_round_trip() {
  Fixture fixture;

  assert(fixture.supply(1, 1'000).ok());
  assert(fixture.post_collateral(2, 10'000).ok());
  assert(fixture.borrow(2, 600).in_p2p == 600);

  // No loops to rematch: the unmatched borrow is parked on the pool as delta.
  fixture.pool.clear_calls();
  const auto withdrawn = fixture.withdraw(1, 1'000, 0);
  check_split(withdrawn, 0);
  assert(withdrawn.split.pool == 400);
  assert(withdrawn.split.delta == 600);
  assert(fixture.dai().deltas.borrow.scaled_delta == 600);
  assert(fixture.dai().deltas.supply.scaled_p2p_total == 0);
  assert(fixture.dai().deltas.borrow.scaled_p2p_total == 600);
  assert(fixture.manager.scaled_balance(kDai, 1).is_zero());
  assert(fixture.pool.borrowed_by_optimizer(kDai) == 600);

  const auto& calls = fixture.pool.calls();
  assert(calls.size() == 2);
  assert(calls[0].action == pool::SimulatedPool::Action::kWithdraw);
  assert(calls[0].amount == 400);
  assert(calls[1].action == pool::SimulatedPool::Action::kBorrow);
  assert(calls[1].amount == 600);

  // The next supplier is matched against the delta first.
  const auto supplied = fixture.supply(3, 1'000);
  check_split(supplied, 10);
  assert(supplied.split.delta == 600);
  assert(supplied.split.pool == 400);
  assert(supplied.in_p2p == 600);
  assert(supplied.on_pool == 400);
  assert(fixture.dai().deltas.borrow.scaled_delta == 0);
  assert(fixture.dai().deltas.supply.scaled_p2p_total == 600);
  assert(fixture.pool.borrowed_by_optimizer(kDai) == 0);
}

void test_idle_supply() {
  Fixture fixture(1'000);
  auto capped = default_reserve();
  capped.supply_cap = 1'500;
  fixture.pool.set_configuration(kDai, capped);

  assert(fixture.supply(1, 500).ok());
  assert(fixture.post_collateral(2, 10'000).ok());
  assert(fixture.borrow(2, 500).in_p2p == 500);
  assert(fixture.supply(3, 500).on_pool == 500);
  assert(fixture.pool.total_supply(kDai) == 1'500);

  // The pool is at its cap: the supply freed by the repayment stays idle.
  fixture.pool.clear_calls();
  const auto repaid = fixture.repay(2, 500);
  check_split(repaid, 10);
  assert(repaid.split.idle == 500);
  assert(fixture.dai().idle_supply == 500);
  assert(fixture.dai().deltas.supply.scaled_p2p_total == 500);
  assert(fixture.dai().deltas.borrow.scaled_p2p_total == 0);
  assert(fixture.manager.scaled_balance(kDai, 1).scaled_p2p_supply == 500);
  assert(fixture.pool.calls().empty());

  // Idle supply is lent out first.
  assert(fixture.post_collateral(4, 10'000).ok());
  fixture.pool.clear_calls();
  const auto borrowed = fixture.borrow(4, 200);
  check_split(borrowed, 10);
  assert(borrowed.split.idle == 200);
  assert(borrowed.in_p2p == 200);
  assert(fixture.dai().idle_supply == 300);
  assert(fixture.dai().deltas.borrow.scaled_p2p_total == 200);
  assert(fixture.pool.calls().empty());

  // The withdrawing supplier takes the idle part, a pool supplier covers the rest.
  const auto withdrawn = fixture.withdraw(1, 500);
  check_split(withdrawn, 10);
  assert(withdrawn.split.idle == 300);
  assert(withdrawn.split.p2p == 200);
  assert(fixture.dai().idle_supply == 0);
  assert(fixture.dai().deltas.supply.scaled_p2p_total == 200);
  assert(fixture.manager.scaled_balance(kDai, 3).scaled_p2p_supply == 200);
  assert(fixture.manager.scaled_balance(kDai, 3).scaled_pool_supply == 300);
  assert(fixture.manager.supply_balance(kDai, 1) == 0);
}

void test_conservation() {
  Fixture fixture;
  fixture.set_dai_indexes(ray_percent(110), ray_percent(120));

  for (UserId user = 10; user <= 14; ++user) {
    check_split(fixture.supply(user, 1'000 + user * 37), 10);
  }
  for (UserId user = 20; user <= 22; ++user) {
    assert(fixture.post_collateral(user, 1'000'000).ok());
  }

  check_split(fixture.borrow(20, 777, 2), 2);
  check_split(fixture.borrow(21, 1'234, 2), 2);
  check_split(fixture.borrow(22, 3'000, 2), 2);
  check_split(fixture.supply(15, 5'000, 1), 1);
  check_split(fixture.withdraw(10, 1'000'000'000, 0), 0);
  check_split(fixture.repay(20, 999, 1), 1);
  check_split(fixture.withdraw(11, 500, 3), 3);
  check_split(fixture.repay(21, 1'000'000'000), 10);
  check_split(fixture.supply(16, 321), 10);
  check_split(fixture.borrow(22, 50), 10);

  // Interest accrues on both sides before the rest unwinds.
  fixture.set_dai_indexes(ray_percent(115), ray_percent(130));
  check_split(fixture.withdraw(12, 1'000'000'000, 2), 2);
  check_split(fixture.repay(22, 1'000'000'000, 1), 1);
  for (UserId user = 13; user <= 16; ++user) {
    check_split(fixture.withdraw(user, 1'000'000'000), 10);
  }
}

void test_full_unwind() {
  // Pool only: the reported balance can be withdrawn entirely after interest.
  {
    Fixture fixture;
    assert(fixture.supply(1, 1'000).ok());
    fixture.set_dai_indexes(ray_percent(110), ray_percent(120));
    assert(fixture.manager.update_indexes(kDai) == Error::kNone);

    const Amount balance = fixture.manager.supply_balance(kDai, 1);
    assert(balance == 1'100);
    const auto withdrawn = fixture.withdraw(1, balance);
    assert(withdrawn.ok());
    assert(withdrawn.on_pool == 0);
    assert(withdrawn.in_p2p == 0);
    assert(fixture.manager.scaled_balance(kDai, 1).is_zero());
  }

  // Peer-to-peer: borrower and supplier both unwind to zero.
  {
    Fixture fixture;
    assert(fixture.supply(1, 1'000).ok());
    assert(fixture.post_collateral(2, 10'000).ok());
    assert(fixture.borrow(2, 1'000).in_p2p == 1'000);

    fixture.set_dai_indexes(ray_percent(110), ray_percent(120));
    assert(fixture.manager.update_indexes(kDai) == Error::kNone);
    assert(fixture.dai().indexes.supply.p2p_index == ray_percent(115));
    assert(fixture.dai().indexes.borrow.p2p_index == ray_percent(115));

    const Amount debt = fixture.manager.borrow_balance(kDai, 2);
    assert(debt == 1'150);
    const auto repaid = fixture.repay(2, debt);
    assert(repaid.ok());
    assert(repaid.on_pool == 0);
    assert(repaid.in_p2p == 0);

    // Repaying more than owed is capped and the debt stays at zero.
    assert(fixture.repay(2, 1).error == Error::kDebtIsZero);

    const Amount balance = fixture.manager.supply_balance(kDai, 1);
    const auto withdrawn = fixture.withdraw(1, balance + 1'000);
    assert(withdrawn.ok());
    assert(withdrawn.amount == balance);
    assert(fixture.manager.scaled_balance(kDai, 1).is_zero());
    assert(fixture.dai().deltas.supply.scaled_p2p_total == 0);
    assert(fixture.dai().deltas.borrow.scaled_p2p_total == 0);
  }
}

void test_rounding_monotonicity() {
  Fixture fixture;
  fixture.set_dai_indexes(ray_percent(110), ray_percent(110));

  Amount deposited = 0;
  for (int i = 0; i < 30; ++i) {
    assert(fixture.supply(1, 7).ok());
    deposited += 7;
    assert(fixture.manager.supply_balance(kDai, 1) <= deposited);

    const auto withdrawn = fixture.withdraw(1, 3);
    assert(withdrawn.ok());
    assert(withdrawn.amount <= 3);
    deposited -= withdrawn.amount;
    assert(fixture.manager.supply_balance(kDai, 1) <= deposited);
  }
}

void test_liquidation_regimes() {
  const Amount one{"1000000000000000000"};

  Fixture fixture;
  fixture.oracle.set_price(kDai, one);
  fixture.oracle.set_price(kEth, one);
  assert(fixture.post_collateral(2, 1'000).ok());
  assert(fixture.borrow(2, 800).ok());

  // 850 / 800: healthy.
  assert(fixture.liquidate(9, 2, 800).error == Error::kUnauthorizedLiquidate);

  // Debt worth exactly the liquidation threshold: still not liquidatable.
  fixture.oracle.set_price(kDai, one * 10'625 / 10'000);
  assert(fixture.manager.health_factor(2) == math::kWad);
  assert(fixture.liquidate(9, 2, 800).error == Error::kUnauthorizedLiquidate);

  // One unit below one: the default close factor applies, if the sentinel allows it.
  fixture.oracle.set_price(kDai, one * 10'625 / 10'000 + 1);
  assert(fixture.manager.health_factor(2) == math::kWad - 1);

  fixture.oracle.set_liquidation_allowed(false);
  assert(fixture.liquidate(9, 2, 800).error == Error::kSentinelLiquidateNotEnabled);
  fixture.oracle.set_liquidation_allowed(true);

  const auto partial = fixture.liquidate(9, 2, 100);
  assert(partial.ok());
  assert(partial.close_factor == risk::kDefaultCloseFactor);
  assert(partial.repaid == 100);
  assert(partial.seized == 111);
  assert(fixture.manager.borrow_balance(kDai, 2) == 700);
  assert(fixture.manager.collateral_balance(kEth, 2) == 889);

  // Far below the threshold the whole debt can be closed.
  fixture.oracle.set_price(kDai, 2 * one);
  const auto full = fixture.liquidate(9, 2, 1'000'000);
  assert(full.ok());
  assert(full.close_factor == risk::kMaxCloseFactor);
  assert(full.seized == 889);

  // Deprecated markets are fully liquidatable whatever the health factor.
  Fixture deprecated;
  assert(deprecated.post_collateral(2, 1'000).ok());
  assert(deprecated.borrow(2, 100).ok());
  assert(deprecated.liquidate(9, 2, 100).error == Error::kUnauthorizedLiquidate);
  assert(deprecated.manager.set_is_borrow_paused(kDai, true) == Error::kNone);
  assert(deprecated.manager.set_is_deprecated(kDai, true) == Error::kNone);

  const auto closed = deprecated.liquidate(9, 2, 40);
  assert(closed.ok());
  assert(closed.close_factor == risk::kMaxCloseFactor);
  assert(closed.repaid == 40);
  assert(closed.seized == 42);
}

void test_liquidation_execution() {
  const Amount one{"1000000000000000000"};

  Fixture fixture;
  fixture.oracle.set_price(kDai, one);
  fixture.oracle.set_price(kEth, one);
  assert(fixture.post_collateral(2, 1'000).ok());
  assert(fixture.borrow(2, 800).ok());
  fixture.oracle.set_price(kDai, 2 * one);

  (void)fixture.sink.drain();
  fixture.pool.clear_calls();

  // Repaying 800 would cost 1680 of collateral: everything is seized and the
  // repayment is scaled down to what 1000 covers with the bonus.
  const auto result = fixture.liquidate(9, 2, 800);
  assert(result.ok());
  assert(result.seized == 1'000);
  assert(result.repaid == 476);
  assert(fixture.manager.collateral_balance(kEth, 2) == 0);
  assert(fixture.manager.borrow_balance(kDai, 2) == 324);
  assert(fixture.manager.ledger().collaterals(2).empty());

  const auto& calls = fixture.pool.calls();
  assert(calls.size() == 2);
  assert(calls[0].action == pool::SimulatedPool::Action::kRepay);
  assert(calls[0].asset == kDai);
  assert(calls[0].amount == 476);
  assert(calls[1].action == pool::SimulatedPool::Action::kWithdraw);
  assert(calls[1].asset == kEth);
  assert(calls[1].amount == 1'000);

  const auto events = fixture.sink.drain();
  assert(!events.empty());
  const auto& liquidated = events.back();
  assert(liquidated.type == EventType::kLiquidated);
  assert(liquidated.actor == 9);
  assert(liquidated.target == 2);
  assert(liquidated.related_asset == kEth);
  assert(liquidated.amount == 476);
  assert(liquidated.related_amount == 1'000);

  // Nothing left to seize.
  assert(fixture.liquidate(9, 2, 100).error == Error::kCollateralIsZero);

  // Input and policy checks.
  assert(fixture.liquidate(9, 2, 0).error == Error::kAmountIsZero);
  assert(fixture.liquidate(common::kNoUser, 2, 100).error == Error::kAddressIsZero);
  assert(fixture.manager
             .liquidate({.liquidator = 9,
                         .borrow_asset = 7,
                         .collateral_asset = kEth,
                         .borrower = 2,
                         .max_debt_to_cover = 100})
             .error == Error::kMarketNotCreated);
  assert(fixture.manager.set_is_liquidate_borrow_paused(kDai, true) == Error::kNone);
  assert(fixture.liquidate(9, 2, 100).error == Error::kLiquidateBorrowIsPaused);
  assert(fixture.manager.set_is_liquidate_collateral_paused(kEth, true) == Error::kNone);
  assert(fixture.liquidate(9, 2, 100).error == Error::kLiquidateCollateralIsPaused);
  assert(fixture.manager.pause_all(kEth, false) == Error::kNone);
  assert(fixture.manager.pause_all(kDai, false) == Error::kNone);
  assert(fixture.manager.set_is_collateral(kEth, false) == Error::kNone);
  assert(fixture.liquidate(9, 2, 100).error == Error::kAssetNotCollateral);
}

void test_validation_errors() {
  Fixture fixture;
  assert(fixture.supply(1, 1'000).ok());
  assert(fixture.post_collateral(2, 1'000).ok());
  (void)fixture.sink.drain();

  assert(fixture.supply(1, 0).error == Error::kAmountIsZero);
  assert(fixture.supply(common::kNoUser, 10).error == Error::kAddressIsZero);
  assert(fixture.manager.supply({.caller = 1, .asset = 9, .amount = 10, .on_behalf = 1}).error ==
         Error::kMarketNotCreated);
  assert(fixture.manager.borrow({.caller = 2, .asset = kDai, .amount = 10, .on_behalf = 2}).error ==
         Error::kAddressIsZero);

  // Only the owner or an approved manager may move funds out of a position.
  const positions::WithdrawRequest by_manager{
      .caller = 3, .asset = kDai, .amount = 100, .on_behalf = 1, .receiver = 3};
  assert(fixture.manager.withdraw(by_manager).error == Error::kPermissionDenied);
  assert(fixture.manager.borrow({.caller = 3, .asset = kDai, .amount = 10, .on_behalf = 2, .receiver = 3}).error ==
         Error::kPermissionDenied);
  fixture.registry.approve_manager(1, 3, true);
  const auto managed = fixture.manager.withdraw(by_manager);
  assert(managed.ok());
  assert(fixture.manager.supply_balance(kDai, 1) == 900);

  assert(fixture.repay(1, 10).error == Error::kDebtIsZero);
  assert(fixture.withdraw(4, 10).error == Error::kSupplyIsZero);

  assert(fixture.manager.set_is_supply_paused(kDai, true) == Error::kNone);
  assert(fixture.supply(1, 10).error == Error::kSupplyIsPaused);
  assert(fixture.manager.set_is_withdraw_paused(kDai, true) == Error::kNone);
  assert(fixture.withdraw(1, 10).error == Error::kWithdrawIsPaused);
  assert(fixture.manager.set_is_repay_paused(kDai, true) == Error::kNone);
  assert(fixture.repay(2, 10).error == Error::kRepayIsPaused);
  assert(fixture.manager.set_is_borrow_paused(kDai, true) == Error::kNone);
  assert(fixture.borrow(2, 10).error == Error::kBorrowIsPaused);
  assert(fixture.manager.pause_all(kDai, false) == Error::kNone);

  auto config = default_reserve();
  config.borrowing_enabled = false;
  fixture.pool.set_configuration(kDai, config);
  assert(fixture.borrow(2, 10).error == Error::kBorrowNotEnabled);
  config.borrowing_enabled = true;
  config.borrow_cap = 100;
  fixture.pool.set_configuration(kDai, config);
  // 900 of supply is waiting on the pool, so the whole borrow could be matched
  // peer-to-peer; the cap still applies to the full amount.
  assert(fixture.manager.scaled_balance(kDai, 1).scaled_pool_supply == 900);
  assert(fixture.borrow(2, 101).error == Error::kExceedsBorrowCap);
  assert(fixture.manager.scaled_balance(kDai, 1).scaled_pool_supply == 900);
  fixture.pool.set_configuration(kDai, default_reserve());

  fixture.oracle.set_borrow_allowed(false);
  assert(fixture.borrow(2, 10).error == Error::kSentinelBorrowNotEnabled);
  fixture.oracle.set_borrow_allowed(true);

  // 1000 of collateral at 80% LTV.
  assert(fixture.borrow(2, 801).error == Error::kUnauthorizedBorrow);
  assert(fixture.borrow(5, 1).error == Error::kUnauthorizedBorrow);
  assert(fixture.borrow(2, 800).ok());

  const positions::CollateralRequest take_collateral{
      .caller = 2, .asset = kEth, .amount = 100, .on_behalf = 2, .receiver = 2};
  assert(fixture.manager.withdraw_collateral(take_collateral).error == Error::kUnauthorizedWithdraw);
  assert(fixture.manager.withdraw_collateral({.caller = 5, .asset = kEth, .amount = 1, .on_behalf = 5, .receiver = 5})
             .error == Error::kCollateralIsZero);
  assert(fixture.manager.set_is_withdraw_collateral_paused(kEth, true) == Error::kNone);
  assert(fixture.manager.withdraw_collateral(take_collateral).error == Error::kWithdrawCollateralIsPaused);

  assert(fixture.manager.set_is_supply_collateral_paused(kEth, true) == Error::kNone);
  assert(fixture.post_collateral(2, 10).error == Error::kSupplyCollateralIsPaused);
  assert(fixture.manager.set_is_collateral(kDai, false) == Error::kNone);
  assert(fixture.manager.supply_collateral({.caller = 1, .asset = kDai, .amount = 10, .on_behalf = 1}).error ==
         Error::kAssetNotCollateral);

  // Rejected operations publish nothing. Only the manager withdrawal and the
  // successful borrow went through.
  const auto events = fixture.sink.drain();
  std::size_t flows = 0;
  for (const auto& event : events) {
    if (event.type == EventType::kWithdrawn || event.type == EventType::kBorrowed) {
      ++flows;
    }
  }
  assert(flows == 2);

  Fixture e_mode(1'000'000, positions::ManagerConfig{.e_mode_category = 1});
  assert(e_mode.post_collateral(2, 1'000).ok());
  assert(e_mode.borrow(2, 10).error == Error::kInconsistentEMode);
}

void test_market_admin() {
  Fixture fixture;
  (void)fixture.sink.drain();

  assert(fixture.manager.create_market(common::kNoAsset, 0, 0) == Error::kAddressIsZero);
  assert(fixture.manager.create_market(3, 10'001, 0) == Error::kExceedsMaxBasisPoints);
  assert(fixture.manager.create_market(kDai, 500, 500) == Error::kNone);
  assert(fixture.manager.ledger().markets().size() == 2);
  assert(fixture.dai().reserve_factor == 0);

  fixture.pool.list_reserve(3, default_reserve(),
                            pool::ReserveIndexes{.pool_supply_index = ray_percent(105), .pool_borrow_index = ray_percent(107)});
  assert(fixture.manager.create_market(3, 1'000, 3'333) == Error::kNone);
  const auto* listed = fixture.manager.market(3);
  assert(listed != nullptr);
  assert(listed->indexes.supply.pool_index == ray_percent(105));
  assert(listed->indexes.supply.p2p_index == math::kRay);
  assert(listed->indexes.borrow.p2p_index == math::kRay);
  assert(!listed->is_collateral);
  const auto created = fixture.sink.drain();
  assert(created.size() == 1);
  assert(created[0].type == EventType::kMarketCreated);
  assert(created[0].asset == 3);

  assert(fixture.manager.set_is_supply_paused(99, true) == Error::kMarketNotCreated);
  assert(fixture.manager.update_indexes(99) == Error::kMarketNotCreated);

  // Deprecation requires borrowing to be paused, and keeps it paused.
  assert(fixture.manager.set_is_deprecated(kDai, true) == Error::kBorrowNotPaused);
  assert(fixture.manager.set_is_borrow_paused(kDai, true) == Error::kNone);
  assert(fixture.manager.set_is_deprecated(kDai, true) == Error::kNone);
  assert(fixture.manager.set_is_borrow_paused(kDai, false) == Error::kMarketIsDeprecated);
  assert(fixture.manager.pause_all(kDai, false) == Error::kNone);
  assert(fixture.dai().pause.is_borrow_paused);
  assert(!fixture.dai().pause.is_supply_paused);
  assert(fixture.manager.pause_all(kDai, true) == Error::kNone);
  assert(fixture.dai().pause.is_liquidate_borrow_paused);
  assert(fixture.manager.set_is_deprecated(kDai, false) == Error::kNone);
  assert(fixture.manager.pause_all(kDai, false) == Error::kNone);
  assert(!fixture.dai().pause.is_borrow_paused);

  assert(fixture.manager.set_reserve_factor(kDai, 20'000) == Error::kExceedsMaxBasisPoints);
  assert(fixture.manager.set_reserve_factor(kDai, 2'500) == Error::kNone);
  assert(fixture.dai().reserve_factor == 2'500);
  assert(fixture.manager.set_p2p_index_cursor(kDai, 10'001) == Error::kExceedsMaxBasisPoints);
  assert(fixture.manager.set_p2p_index_cursor(kDai, 7'000) == Error::kNone);
  assert(fixture.dai().p2p_index_cursor == 7'000);

  fixture.manager.set_max_sorted_users(4);
  assert(fixture.manager.ledger().max_sorted_users() == 4);
  assert(fixture.manager.config().max_sorted_users == 4);

  // With the default budget at zero nobody is matched.
  fixture.manager.set_default_iterations(positions::Iterations{.supply = 0, .borrow = 0, .repay = 0, .withdraw = 0});
  assert(fixture.supply(1, 500).ok());
  assert(fixture.post_collateral(2, 10'000).ok());
  const auto unmatched = fixture.borrow(2, 100);
  assert(unmatched.ok());
  assert(unmatched.split.pool == 100);
  fixture.manager.set_default_iterations(positions::Iterations{});

  // Peer-to-peer disabled: borrows go to the pool even with suppliers waiting.
  assert(fixture.manager.set_is_p2p_disabled(kDai, true) == Error::kNone);
  const auto pooled = fixture.borrow(2, 100);
  assert(pooled.ok());
  assert(pooled.in_p2p == 0);
  assert(pooled.split.pool == 100);
  assert(fixture.manager.scaled_balance(kDai, 1).scaled_p2p_supply == 0);

  assert(fixture.manager.set_is_p2p_disabled(kDai, false) == Error::kNone);
  const auto matched = fixture.borrow(2, 100);
  assert(matched.split.p2p == 100);
}

void test_rollback_on_pool_failure() {
  Fixture fixture;
  assert(fixture.post_collateral(2, 10'000).ok());
  assert(fixture.borrow(2, 300).on_pool == 300);
  (void)fixture.sink.drain();
  const ledger::Market before = fixture.dai();

  // Promoting the borrower happens before the pool is called; the failure
  // must undo it.
  fixture.pool.fail_next_call("outage");
  bool threw = false;
  try {
    (void)fixture.supply(1, 1'000);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  const auto borrower = fixture.manager.scaled_balance(kDai, 2);
  assert(borrower.scaled_pool_borrow == 300);
  assert(borrower.scaled_p2p_borrow == 0);
  assert(fixture.manager.ledger().ranking(kDai, Bucket::kPoolBorrow).value_of(2) == 300);
  assert(!fixture.manager.ledger().ranking(kDai, Bucket::kP2PBorrow).contains(2));
  assert(!fixture.manager.ledger().ranking(kDai, Bucket::kPoolSupply).contains(1));
  assert(fixture.manager.scaled_balance(kDai, 1).is_zero());
  assert(fixture.dai().deltas.supply.scaled_p2p_total == before.deltas.supply.scaled_p2p_total);
  assert(fixture.dai().deltas.borrow.scaled_p2p_total == before.deltas.borrow.scaled_p2p_total);
  assert(fixture.sink.pending() == 0);
  assert(fixture.pool.borrowed_by_optimizer(kDai) == 300);

  // The first queued call (repaying the promoted borrower) is accepted but the
  // second one (the pool supply of the rest) would break the supply cap.
  auto capped = default_reserve();
  capped.supply_cap = 1'000'100;
  fixture.pool.set_configuration(kDai, capped);
  fixture.pool.clear_calls();
  threw = false;
  try {
    (void)fixture.supply(1, 1'000);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(fixture.pool.calls().empty());
  assert(fixture.pool.borrowed_by_optimizer(kDai) == 300);
  assert(fixture.pool.supplied_by_optimizer(kDai) == 0);
  assert(fixture.manager.scaled_balance(kDai, 2).scaled_pool_borrow == 300);
  assert(fixture.manager.scaled_balance(kDai, 2).scaled_p2p_borrow == 0);
  assert(fixture.manager.scaled_balance(kDai, 1).is_zero());
  assert(fixture.dai().deltas.supply.scaled_p2p_total == before.deltas.supply.scaled_p2p_total);
  assert(fixture.dai().deltas.borrow.scaled_p2p_total == before.deltas.borrow.scaled_p2p_total);
  assert(fixture.sink.pending() == 0);
  fixture.pool.set_configuration(kDai, default_reserve());

  // The same operation succeeds once the pool is back.
  const auto retried = fixture.supply(1, 1'000);
  check_split(retried, 10);
  assert(retried.split.p2p == 300);
  assert(retried.split.pool == 700);
  assert(fixture.manager.scaled_balance(kDai, 2).scaled_p2p_borrow == 300);
  assert(fixture.pool.borrowed_by_optimizer(kDai) == 0);
}

void test_flow_events() {
  Fixture fixture;
  const auto listed = fixture.sink.drain();
  assert(listed.size() == 2);
  assert(listed[0].type == EventType::kMarketCreated);

  assert(fixture.supply(1, 500).ok());
  auto events = fixture.sink.drain();
  assert(events.size() == 1);
  assert(events[0].type == EventType::kSupplied);
  assert(events[0].actor == 1);
  assert(events[0].amount == 500);
  assert(events[0].on_pool == 500);

  assert(fixture.post_collateral(2, 10'000).ok());
  events = fixture.sink.drain();
  assert(events.size() == 1);
  assert(events[0].type == EventType::kCollateralSupplied);
  assert(events[0].on_pool == 10'000);

  assert(fixture.borrow(2, 200).ok());
  events = fixture.sink.drain();
  assert(events.size() == 3);
  assert(events[0].type == EventType::kPositionUpdated);
  assert(events[0].actor == 2);
  assert(events[0].target == 1);
  assert(events[0].side == common::Side::kSupply);
  assert(events[0].on_pool == 300);
  assert(events[0].in_p2p == 200);
  assert(events[1].type == EventType::kP2PTotalsUpdated);
  assert(events[1].on_pool == 200);
  assert(events[1].in_p2p == 200);
  assert(events[2].type == EventType::kBorrowed);
  assert(events[2].counterparty == 2);
  assert(events[2].amount == 200);
  assert(events[2].in_p2p == 200);

  // Pool interest is picked up by the next operation on the market.
  fixture.set_dai_indexes(ray_percent(110), ray_percent(120));
  assert(fixture.supply(3, 10).ok());
  events = fixture.sink.drain();
  assert(events.front().type == EventType::kIndexesUpdated);
  assert(events.front().asset == kDai);
  assert(events.front().on_pool == fixture.dai().indexes.supply.p2p_index);
  assert(events.back().type == EventType::kSupplied);
}

void test_repay_into_borrow_delta() {
  Fixture fixture;
  assert(fixture.supply(1, 1'000).ok());
  assert(fixture.supply(3, 500).ok());
  assert(fixture.post_collateral(2, 10'000).ok());
  const auto borrowed = fixture.borrow(2, 1'500);
  check_split(borrowed, 10);
  assert(borrowed.split.p2p == 1'500);

  // Without loops the withdrawn match is not replaced and becomes a borrow delta.
  const auto withdrawn = fixture.withdraw(1, 1'000, 0);
  check_split(withdrawn, 0);
  assert(fixture.dai().deltas.borrow.scaled_delta == 1'000);
  assert(fixture.dai().deltas.supply.scaled_p2p_total == 500);
  assert(fixture.dai().deltas.borrow.scaled_p2p_total == 1'500);
  check_p2p_volumes(fixture, 1, 3);

  // The repay clears the whole delta first; the rest releases matched supply
  // back to the pool.
  const auto repaid = fixture.repay(2, 1'200);
  check_split(repaid, 10);
  assert(repaid.split.delta == 1'000);
  assert(repaid.split.p2p == 200);
  const auto& market = fixture.dai();
  assert(market.deltas.borrow.scaled_delta == 0);
  assert(market.deltas.supply.scaled_p2p_total == 300);
  assert(market.deltas.borrow.scaled_p2p_total == 300);
  assert(fixture.manager.scaled_balance(kDai, 2).scaled_p2p_borrow == 300);
  assert(fixture.manager.scaled_balance(kDai, 3).scaled_p2p_supply == 300);
  assert(fixture.manager.scaled_balance(kDai, 3).scaled_pool_supply == 200);
  check_p2p_volumes(fixture, 1, 3);

  const auto closed = fixture.repay(2, 300);
  check_split(closed, 10);
  assert(fixture.dai().deltas.supply.scaled_p2p_total == 0);
  assert(fixture.dai().deltas.borrow.scaled_p2p_total == 0);
  assert(fixture.manager.supply_balance(kDai, 3) == 500);
  check_p2p_volumes(fixture, 1, 3);
}

void test_p2p_volume_consistency() {
  // Supply is capped close to the seeded liquidity so that repays park idle
  // supply and some pool supplies are refused.
  Fixture fixture;
  auto capped = default_reserve();
  capped.supply_cap = 1'003'000;
  fixture.pool.set_configuration(kDai, capped);

  constexpr UserId kFirst = 1;
  constexpr UserId kLast = 8;
  for (UserId user = kFirst; user <= kLast; ++user) {
    assert(fixture.post_collateral(user, 1'000'000).ok());
  }

  std::mt19937 rng(20240611);
  std::uniform_int_distribution<int> pick_action(0, 3);
  std::uniform_int_distribution<UserId> pick_user(kFirst, kLast);
  std::uniform_int_distribution<unsigned> pick_amount(1, 1'000);
  std::uniform_int_distribution<std::size_t> pick_loops(0, 3);

  std::size_t applied = 0;
  for (int step = 0; step < 400; ++step) {
    const int action = pick_action(rng);
    const UserId user = pick_user(rng);
    const Amount amount = pick_amount(rng);
    const std::size_t loops = pick_loops(rng);

    try {
      PositionResult result;
      switch (action) {
        case 0: result = fixture.supply(user, amount, loops); break;
        case 1: result = fixture.borrow(user, amount, loops); break;
        case 2: result = fixture.repay(user, amount, loops); break;
        default: result = fixture.withdraw(user, amount, loops); break;
      }
      if (result.ok()) {
        check_split(result, loops);
        ++applied;
      }
    } catch (const std::runtime_error& e) {
      assert(std::string(e.what()) == "pool: supply cap exceeded");
      assert(fixture.sink.pending() == 0);
    }
    (void)fixture.sink.drain();
    check_p2p_volumes(fixture, kFirst, kLast);
  }
  assert(applied > 0);
}

}  // namespace lendcore::tests
