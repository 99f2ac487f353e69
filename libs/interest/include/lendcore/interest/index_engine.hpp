#pragma once

#include "lendcore/common/types.hpp"
#include "lendcore/delta/delta_accounting.hpp"

namespace lendcore {
namespace interest {

struct GrowthFactors {
  common::Amount pool_supply{0};  // RAY
  common::Amount pool_borrow{0};
  common::Amount p2p_supply{0};
  common::Amount p2p_borrow{0};
};

struct IndexesParams {
  common::Indexes last{};
  common::Amount pool_supply_index{0};
  common::Amount pool_borrow_index{0};
  delta::Deltas deltas{};
  common::Amount proportion_idle{0};  // RAY
  common::BasisPoints reserve_factor{0};
  common::BasisPoints p2p_index_cursor{0};
};

// Peer-to-peer rates sit between the pool rates at the cursor position, minus
// the reserve factor share of the improvement. When the pool supply index grows
// faster than the borrow index (flash-loan premiums), both sides follow the
// borrow growth.
[[nodiscard]] GrowthFactors compute_growth_factors(const common::Amount& new_pool_supply_index,
                                                   const common::Amount& new_pool_borrow_index,
                                                   const common::Amount& last_pool_supply_index,
                                                   const common::Amount& last_pool_borrow_index,
                                                   common::BasisPoints p2p_index_cursor,
                                                   common::BasisPoints reserve_factor);

// Grows one side's peer-to-peer index. The share of the side parked as delta
// earns the pool rate and the idle share earns nothing.
[[nodiscard]] common::Amount compute_p2p_index(const common::Amount& pool_growth_factor,
                                               const common::Amount& p2p_growth_factor,
                                               const common::MarketSideIndexes& last_indexes,
                                               const delta::MarketSideDelta& delta,
                                               const common::Amount& proportion_idle);

[[nodiscard]] common::Indexes compute_indexes(const IndexesParams& params);

// Share of the peer-to-peer supply sitting idle, in RAY, capped at one.
[[nodiscard]] common::Amount proportion_idle(const common::Amount& idle_supply,
                                             const delta::MarketSideDelta& supply_delta,
                                             const common::Amount& p2p_supply_index);

}  // namespace interest
}  // namespace lendcore
