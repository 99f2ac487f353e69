#include "lendcore/risk/liquidation_manager.hpp"

#include "lendcore/common/math.hpp"

namespace lendcore {
namespace risk {

namespace math = common::math;
using common::Amount;

Amount default_liquidation_threshold() {
  return math::kWad;
}

Amount min_liquidation_threshold() {
  return Amount{"950000000000000000"};
}

LiquidationManager::Authorization LiquidationManager::authorize(const ledger::LedgerReader& ledger,
                                                                const ledger::Market& borrow_market,
                                                                common::UserId borrower) const {
  Authorization result;
  result.health_factor = engine_.health_factor(ledger, borrower);

  // A deprecated market can be fully liquidated whatever the health factor.
  if (borrow_market.is_deprecated) {
    result.status = Status::kNeedsFull;
    result.close_factor = kMaxCloseFactor;
    return result;
  }

  if (result.health_factor >= default_liquidation_threshold()) {
    result.status = Status::kHealthy;
    result.error = common::Error::kUnauthorizedLiquidate;
    return result;
  }

  if (result.health_factor >= min_liquidation_threshold()) {
    if (!engine_.oracle().is_liquidation_allowed()) {
      result.status = Status::kNeedsPartial;
      result.error = common::Error::kSentinelLiquidateNotEnabled;
      return result;
    }
    result.status = Status::kNeedsPartial;
    result.close_factor = kDefaultCloseFactor;
    return result;
  }

  result.status = Status::kNeedsFull;
  result.close_factor = kMaxCloseFactor;
  return result;
}

LiquidationManager::SeizeAmounts LiquidationManager::seize_amounts(common::AssetId borrow_asset,
                                                                   common::AssetId collateral_asset,
                                                                   const Amount& to_repay,
                                                                   const Amount& collateral_balance) const {
  const auto& pool = engine_.pool();
  const auto& oracle = engine_.oracle();

  const Amount borrow_price = oracle.price(borrow_asset);
  const Amount collateral_price = oracle.price(collateral_asset);
  const Amount borrow_unit = token_unit(pool.configuration(borrow_asset).decimals);
  const pool::ReserveConfiguration collateral_config = pool.configuration(collateral_asset);
  const Amount collateral_unit = token_unit(collateral_config.decimals);

  SeizeAmounts amounts;
  amounts.repaid = to_repay;
  amounts.seized = math::percent_mul(
      math::mul_div_down(to_repay * borrow_price, collateral_unit, borrow_unit * collateral_price),
      collateral_config.liquidation_bonus);

  if (amounts.seized > collateral_balance) {
    amounts.seized = collateral_balance;
    amounts.repaid = math::min(
        math::percent_div(
            math::mul_div_down(collateral_balance * collateral_price, borrow_unit, borrow_price * collateral_unit),
            collateral_config.liquidation_bonus),
        to_repay);
  }
  return amounts;
}

}  // namespace risk
}  // namespace lendcore
