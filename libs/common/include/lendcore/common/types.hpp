#pragma once

#include <cstdint>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

namespace lendcore {
namespace common {

using AssetId = std::uint32_t;
using UserId = std::uint64_t;
using BasisPoints = std::uint16_t;

// Raw asset amounts, scaled balances and RAY indexes share one unsigned 256-bit type.
using Amount = boost::multiprecision::uint256_t;

inline constexpr UserId kNoUser = 0;
inline constexpr AssetId kNoAsset = 0;

enum class Side : std::uint8_t {
  kSupply,
  kBorrow,
};

[[nodiscard]] inline constexpr Side opposite(Side side) noexcept {
  return side == Side::kSupply ? Side::kBorrow : Side::kSupply;
}

[[nodiscard]] inline constexpr std::string_view to_string(Side side) noexcept {
  return side == Side::kSupply ? "supply" : "borrow";
}

struct MarketSideIndexes {
  Amount pool_index{0};
  Amount p2p_index{0};
};

struct Indexes {
  MarketSideIndexes supply{};
  MarketSideIndexes borrow{};

  [[nodiscard]] const MarketSideIndexes& of(Side side) const noexcept {
    return side == Side::kSupply ? supply : borrow;
  }
};

}  // namespace common
}  // namespace lendcore
