#pragma once

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace delta {

// Outstanding mismatch for one side of one market.
// scaled_delta is in pool units; scaled_p2p_total is in peer-to-peer units.
struct MarketSideDelta {
  common::Amount scaled_delta{0};
  common::Amount scaled_p2p_total{0};
};

struct Deltas {
  MarketSideDelta supply{};
  MarketSideDelta borrow{};

  [[nodiscard]] MarketSideDelta& of(common::Side side) noexcept {
    return side == common::Side::kSupply ? supply : borrow;
  }
  [[nodiscard]] const MarketSideDelta& of(common::Side side) const noexcept {
    return side == common::Side::kSupply ? supply : borrow;
  }
};

struct DecreaseResult {
  common::Amount consumed{0};   // in underlying
  common::Amount remainder{0};  // in underlying
};

// Matches `amount` against the side delta. The delta value is rounded up and the
// consumed part is removed from the scaled delta rounding up, zero-floored.
[[nodiscard]] DecreaseResult decrease_delta(MarketSideDelta& delta,
                                            const common::Amount& amount,
                                            const common::Amount& pool_index);

// Records a new mismatch of `amount` underlying, scaled by the side pool index
// rounding down. Returns the new scaled delta.
common::Amount increase_delta(MarketSideDelta& delta,
                              const common::Amount& amount,
                              const common::MarketSideIndexes& indexes);

// `amount` is newly matched volume on `side` (the side of the acting user),
// `promoted` is the part of it provided by promoted counterparties.
// Returns `amount` converted to peer-to-peer units of `side`.
common::Amount increase_p2p(Deltas& deltas,
                            const common::Amount& promoted,
                            const common::Amount& amount,
                            const common::Indexes& indexes,
                            common::Side side);

// `amount` is volume unmatched on `side`, `demoted` the part of it broken by
// demoting counterparties.
void decrease_p2p(Deltas& deltas,
                  const common::Amount& demoted,
                  const common::Amount& amount,
                  const common::Indexes& indexes,
                  common::Side side);

// The peer-to-peer fee is the excess of peer-to-peer debt over the supply it is
// matched with (supply not parked as delta or idle). Settles up to `amount` of it
// and returns what is left of `amount`.
[[nodiscard]] common::Amount repay_fee(Deltas& deltas,
                                       const common::Amount& amount,
                                       const common::Indexes& indexes,
                                       const common::Amount& idle_supply);

// Scaled conversions. Credits to a scaled balance round down and debits round
// up, on both sides. Values round in favor of the protocol: supply down, debt up.
[[nodiscard]] common::Amount scale_credit(const common::Amount& amount, const common::Amount& index);
[[nodiscard]] common::Amount scale_debit(const common::Amount& amount, const common::Amount& index);
[[nodiscard]] common::Amount unscale(const common::Amount& scaled, const common::Amount& index,
                                     common::Side side);

}  // namespace delta
}  // namespace lendcore
