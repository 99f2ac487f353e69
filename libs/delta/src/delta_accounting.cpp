#include "lendcore/delta/delta_accounting.hpp"

#include "lendcore/common/math.hpp"

namespace lendcore {
namespace delta {

namespace math = common::math;
using common::Amount;
using common::Side;

DecreaseResult decrease_delta(MarketSideDelta& delta, const Amount& amount, const Amount& pool_index) {
  if (delta.scaled_delta == 0 || amount == 0) {
    return DecreaseResult{.consumed = 0, .remainder = amount};
  }

  const Amount consumed = math::min(math::ray_mul_up(delta.scaled_delta, pool_index), amount);
  delta.scaled_delta = math::zero_floor_sub(delta.scaled_delta, math::ray_div_up(consumed, pool_index));
  return DecreaseResult{.consumed = consumed, .remainder = amount - consumed};
}

Amount increase_delta(MarketSideDelta& delta, const Amount& amount, const common::MarketSideIndexes& indexes) {
  if (amount == 0) {
    return delta.scaled_delta;
  }
  delta.scaled_delta += math::ray_div_down(amount, indexes.pool_index);
  return delta.scaled_delta;
}

Amount increase_p2p(Deltas& deltas,
                    const Amount& promoted,
                    const Amount& amount,
                    const common::Indexes& indexes,
                    Side side) {
  if (amount == 0) {
    return 0;
  }

  const Side counter = common::opposite(side);
  auto& counter_delta = deltas.of(counter);
  auto& side_delta = deltas.of(side);

  counter_delta.scaled_p2p_total += scale_credit(promoted, indexes.of(counter).p2p_index);
  const Amount amount_in_p2p = scale_credit(amount, indexes.of(side).p2p_index);
  side_delta.scaled_p2p_total += amount_in_p2p;
  return amount_in_p2p;
}

void decrease_p2p(Deltas& deltas,
                  const Amount& demoted,
                  const Amount& amount,
                  const common::Indexes& indexes,
                  Side side) {
  if (amount == 0) {
    return;
  }

  const Side counter = common::opposite(side);
  auto& counter_delta = deltas.of(counter);
  auto& side_delta = deltas.of(side);

  counter_delta.scaled_p2p_total = math::zero_floor_sub(
      counter_delta.scaled_p2p_total, scale_debit(demoted, indexes.of(counter).p2p_index));
  side_delta.scaled_p2p_total = math::zero_floor_sub(
      side_delta.scaled_p2p_total, scale_debit(amount, indexes.of(side).p2p_index));
}

Amount repay_fee(Deltas& deltas, const Amount& amount, const common::Indexes& indexes, const Amount& idle_supply) {
  if (amount == 0) {
    return 0;
  }

  const Amount borrowed_p2p = math::ray_mul(deltas.borrow.scaled_p2p_total, indexes.borrow.p2p_index);
  const Amount supplied_p2p = math::ray_mul(deltas.supply.scaled_p2p_total, indexes.supply.p2p_index);
  const Amount supply_delta = math::ray_mul(deltas.supply.scaled_delta, indexes.supply.pool_index);
  const Amount matched_supply = math::zero_floor_sub(math::zero_floor_sub(supplied_p2p, supply_delta), idle_supply);

  const Amount fee = math::zero_floor_sub(borrowed_p2p, matched_supply);
  if (fee == 0) {
    return amount;
  }

  const Amount settled = math::min(fee, amount);
  deltas.borrow.scaled_p2p_total = math::zero_floor_sub(
      deltas.borrow.scaled_p2p_total, math::ray_div_down(settled, indexes.borrow.p2p_index));
  return amount - settled;
}

Amount scale_credit(const Amount& amount, const Amount& index) {
  return math::ray_div_down(amount, index);
}

Amount scale_debit(const Amount& amount, const Amount& index) {
  return math::ray_div_up(amount, index);
}

Amount unscale(const Amount& scaled, const Amount& index, Side side) {
  return side == Side::kSupply ? math::ray_mul_down(scaled, index) : math::ray_mul_up(scaled, index);
}

}  // namespace delta
}  // namespace lendcore
