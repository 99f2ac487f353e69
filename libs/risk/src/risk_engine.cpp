#include "lendcore/risk/risk_engine.hpp"

#include "lendcore/common/math.hpp"

namespace lendcore {
namespace risk {

namespace math = common::math;
using common::Amount;

Amount max_health_factor() {
  return math::kMaxAmount;
}

Amount token_unit(std::uint8_t decimals) {
  Amount unit{1};
  for (std::uint8_t i = 0; i < decimals; ++i) {
    unit *= 10;
  }
  return unit;
}

Amount RiskEngine::supply_balance(const ledger::LedgerReader& ledger, common::AssetId asset, common::UserId user) const {
  const auto* market = ledger.find_market(asset);
  if (!market) {
    return 0;
  }
  const auto balance = ledger.balance(asset, user);
  return math::ray_mul_down(balance.scaled_pool_supply, market->indexes.supply.pool_index) +
         math::ray_mul_down(balance.scaled_p2p_supply, market->indexes.supply.p2p_index);
}

Amount RiskEngine::borrow_balance(const ledger::LedgerReader& ledger, common::AssetId asset, common::UserId user) const {
  const auto* market = ledger.find_market(asset);
  if (!market) {
    return 0;
  }
  const auto balance = ledger.balance(asset, user);
  return math::ray_mul_up(balance.scaled_pool_borrow, market->indexes.borrow.pool_index) +
         math::ray_mul_up(balance.scaled_p2p_borrow, market->indexes.borrow.p2p_index);
}

Amount RiskEngine::collateral_balance(const ledger::LedgerReader& ledger,
                                      common::AssetId asset,
                                      common::UserId user) const {
  const auto* market = ledger.find_market(asset);
  if (!market) {
    return 0;
  }
  return math::ray_mul_down(ledger.balance(asset, user).scaled_collateral, market->indexes.supply.pool_index);
}

LiquidityData RiskEngine::liquidity_data(const ledger::LedgerReader& ledger, common::UserId user) const {
  return liquidity_data_with_delta(ledger, user, std::nullopt);
}

LiquidityData RiskEngine::liquidity_data_with_delta(const ledger::LedgerReader& ledger,
                                                    common::UserId user,
                                                    std::optional<CollateralDelta> delta) const {
  LiquidityData data;

  for (const common::AssetId asset : ledger.collaterals(user)) {
    Amount balance = collateral_balance(ledger, asset, user);
    if (delta && delta->asset == asset) {
      balance = math::zero_floor_sub(balance, delta->withdrawn);
    }
    if (balance == 0) {
      continue;
    }

    const pool::ReserveConfiguration config = pool_.configuration(asset);
    const Amount value = math::mul_div_down(balance, oracle_.price(asset), token_unit(config.decimals));
    data.borrowable += math::percent_mul_down(value, config.ltv);
    data.max_debt += math::percent_mul_down(value, config.liquidation_threshold);
  }

  for (const common::AssetId asset : ledger.borrowed(user)) {
    const Amount balance = borrow_balance(ledger, asset, user);
    if (balance == 0) {
      continue;
    }
    const pool::ReserveConfiguration config = pool_.configuration(asset);
    data.debt += math::mul_div_up(balance, oracle_.price(asset), token_unit(config.decimals));
  }

  return data;
}

Amount RiskEngine::health_factor(const LiquidityData& data) {
  if (data.debt == 0) {
    return max_health_factor();
  }
  return math::mul_div_down(data.max_debt, math::kWad, data.debt);
}

Amount RiskEngine::health_factor(const ledger::LedgerReader& ledger, common::UserId user) const {
  return health_factor(liquidity_data(ledger, user));
}

common::Error RiskEngine::authorize_borrow(const ledger::LedgerReader& ledger,
                                           common::UserId user,
                                           common::AssetId asset,
                                           const Amount& amount) const {
  const LiquidityData data = liquidity_data(ledger, user);
  const pool::ReserveConfiguration config = pool_.configuration(asset);
  const Amount borrowed_value = math::mul_div_up(amount, oracle_.price(asset), token_unit(config.decimals));

  if (data.debt + borrowed_value > data.borrowable) {
    return common::Error::kUnauthorizedBorrow;
  }
  return common::Error::kNone;
}

common::Error RiskEngine::authorize_withdraw_collateral(const ledger::LedgerReader& ledger,
                                                        common::UserId user,
                                                        common::AssetId asset,
                                                        const Amount& amount) const {
  const LiquidityData data =
      liquidity_data_with_delta(ledger, user, CollateralDelta{.asset = asset, .withdrawn = amount});
  if (health_factor(data) < math::kWad) {
    return common::Error::kUnauthorizedWithdraw;
  }
  return common::Error::kNone;
}

}  // namespace risk
}  // namespace lendcore
