#include "lendcore/interest/index_engine.hpp"

#include "lendcore/common/math.hpp"

namespace lendcore {
namespace interest {

namespace math = common::math;
using common::Amount;

GrowthFactors compute_growth_factors(const Amount& new_pool_supply_index,
                                     const Amount& new_pool_borrow_index,
                                     const Amount& last_pool_supply_index,
                                     const Amount& last_pool_borrow_index,
                                     common::BasisPoints p2p_index_cursor,
                                     common::BasisPoints reserve_factor) {
  GrowthFactors factors;
  factors.pool_supply = math::ray_div(new_pool_supply_index, last_pool_supply_index);
  factors.pool_borrow = math::ray_div(new_pool_borrow_index, last_pool_borrow_index);

  if (factors.pool_supply <= factors.pool_borrow) {
    const Amount p2p_growth = math::weighted_avg(factors.pool_supply, factors.pool_borrow, p2p_index_cursor);
    factors.p2p_supply = p2p_growth - math::percent_mul(p2p_growth - factors.pool_supply, reserve_factor);
    factors.p2p_borrow = p2p_growth + math::percent_mul(factors.pool_borrow - p2p_growth, reserve_factor);
  } else {
    factors.p2p_supply = factors.pool_borrow;
    factors.p2p_borrow = factors.pool_borrow;
  }
  return factors;
}

Amount compute_p2p_index(const Amount& pool_growth_factor,
                         const Amount& p2p_growth_factor,
                         const common::MarketSideIndexes& last_indexes,
                         const delta::MarketSideDelta& delta,
                         const Amount& proportion_idle) {
  if (delta.scaled_p2p_total == 0) {
    return math::ray_mul(last_indexes.p2p_index, p2p_growth_factor);
  }

  const Amount delta_value = math::ray_mul(delta.scaled_delta, last_indexes.pool_index);
  const Amount p2p_value = math::ray_mul(delta.scaled_p2p_total, last_indexes.p2p_index);
  const Amount matched_share = math::zero_floor_sub(math::kRay, proportion_idle);
  const Amount proportion_delta =
      p2p_value == 0 ? matched_share : math::min(math::ray_div_up(delta_value, p2p_value), matched_share);

  const Amount growth = math::ray_mul(p2p_growth_factor, matched_share - proportion_delta) +
                        math::ray_mul(pool_growth_factor, proportion_delta) + proportion_idle;
  return math::ray_mul(last_indexes.p2p_index, growth);
}

common::Indexes compute_indexes(const IndexesParams& params) {
  const GrowthFactors factors = compute_growth_factors(params.pool_supply_index,
                                                       params.pool_borrow_index,
                                                       params.last.supply.pool_index,
                                                       params.last.borrow.pool_index,
                                                       params.p2p_index_cursor,
                                                       params.reserve_factor);

  common::Indexes indexes;
  indexes.supply.pool_index = params.pool_supply_index;
  indexes.borrow.pool_index = params.pool_borrow_index;
  indexes.supply.p2p_index = compute_p2p_index(factors.pool_supply, factors.p2p_supply, params.last.supply,
                                               params.deltas.supply, params.proportion_idle);
  indexes.borrow.p2p_index =
      compute_p2p_index(factors.pool_borrow, factors.p2p_borrow, params.last.borrow, params.deltas.borrow, 0);
  return indexes;
}

Amount proportion_idle(const Amount& idle_supply, const delta::MarketSideDelta& supply_delta,
                       const Amount& p2p_supply_index) {
  if (idle_supply == 0) {
    return 0;
  }
  const Amount p2p_value = math::ray_mul(supply_delta.scaled_p2p_total, p2p_supply_index);
  if (p2p_value == 0) {
    return math::kRay;
  }
  return math::min(math::ray_div_up(idle_supply, p2p_value), math::kRay);
}

}  // namespace interest
}  // namespace lendcore
