#pragma once

#include <array>
#include <cstdint>

#include "lendcore/common/types.hpp"
#include "lendcore/delta/delta_accounting.hpp"

namespace lendcore {
namespace ledger {

struct PauseStatuses {
  bool is_supply_paused{false};
  bool is_borrow_paused{false};
  bool is_repay_paused{false};
  bool is_withdraw_paused{false};
  bool is_supply_collateral_paused{false};
  bool is_withdraw_collateral_paused{false};
  bool is_liquidate_collateral_paused{false};
  bool is_liquidate_borrow_paused{false};
};

struct Market {
  common::AssetId asset{common::kNoAsset};
  common::Indexes indexes{};
  delta::Deltas deltas{};
  common::Amount idle_supply{0};
  PauseStatuses pause{};
  common::BasisPoints reserve_factor{0};
  common::BasisPoints p2p_index_cursor{0};
  bool is_created{false};
  bool is_collateral{false};
  bool is_p2p_disabled{false};
  bool is_deprecated{false};
};

// Ranking buckets kept per market.
enum class Bucket : std::uint8_t {
  kPoolSupply,
  kP2PSupply,
  kPoolBorrow,
  kP2PBorrow,
};

inline constexpr std::size_t kBucketCount = 4;

[[nodiscard]] inline constexpr Bucket pool_bucket(common::Side side) noexcept {
  return side == common::Side::kSupply ? Bucket::kPoolSupply : Bucket::kPoolBorrow;
}

[[nodiscard]] inline constexpr Bucket p2p_bucket(common::Side side) noexcept {
  return side == common::Side::kSupply ? Bucket::kP2PSupply : Bucket::kP2PBorrow;
}

[[nodiscard]] inline constexpr common::Side side_of(Bucket bucket) noexcept {
  return (bucket == Bucket::kPoolSupply || bucket == Bucket::kP2PSupply) ? common::Side::kSupply
                                                                          : common::Side::kBorrow;
}

struct UserMarketBalance {
  common::Amount scaled_pool_supply{0};
  common::Amount scaled_p2p_supply{0};
  common::Amount scaled_pool_borrow{0};
  common::Amount scaled_p2p_borrow{0};
  common::Amount scaled_collateral{0};

  [[nodiscard]] common::Amount& of(Bucket bucket) noexcept {
    switch (bucket) {
      case Bucket::kPoolSupply: return scaled_pool_supply;
      case Bucket::kP2PSupply: return scaled_p2p_supply;
      case Bucket::kPoolBorrow: return scaled_pool_borrow;
      case Bucket::kP2PBorrow: return scaled_p2p_borrow;
    }
    return scaled_pool_supply;
  }

  [[nodiscard]] const common::Amount& of(Bucket bucket) const noexcept {
    return const_cast<UserMarketBalance*>(this)->of(bucket);
  }

  [[nodiscard]] bool has_borrow() const noexcept {
    return scaled_pool_borrow != 0 || scaled_p2p_borrow != 0;
  }

  [[nodiscard]] bool is_zero() const noexcept {
    return scaled_pool_supply == 0 && scaled_p2p_supply == 0 && !has_borrow() && scaled_collateral == 0;
  }
};

}  // namespace ledger
}  // namespace lendcore
