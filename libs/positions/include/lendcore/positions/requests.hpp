#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "lendcore/common/errors.hpp"
#include "lendcore/common/types.hpp"

namespace lendcore {
namespace positions {

// Loop budgets used when a request does not carry its own.
struct Iterations {
  std::size_t supply{10};
  std::size_t borrow{10};
  std::size_t repay{10};
  std::size_t withdraw{10};
};

struct ManagerConfig {
  std::size_t max_sorted_users{16};
  Iterations default_iterations{};
  std::uint8_t e_mode_category{0};  // 0 = no e-mode
};

struct SupplyRequest {
  common::UserId caller{common::kNoUser};
  common::AssetId asset{common::kNoAsset};
  common::Amount amount{0};
  common::UserId on_behalf{common::kNoUser};
  std::optional<std::size_t> max_loops{};
};

struct BorrowRequest {
  common::UserId caller{common::kNoUser};
  common::AssetId asset{common::kNoAsset};
  common::Amount amount{0};
  common::UserId on_behalf{common::kNoUser};
  common::UserId receiver{common::kNoUser};
  std::optional<std::size_t> max_loops{};
};

struct RepayRequest {
  common::UserId caller{common::kNoUser};
  common::AssetId asset{common::kNoAsset};
  common::Amount amount{0};
  common::UserId on_behalf{common::kNoUser};
  std::optional<std::size_t> max_loops{};
};

struct WithdrawRequest {
  common::UserId caller{common::kNoUser};
  common::AssetId asset{common::kNoAsset};
  common::Amount amount{0};
  common::UserId on_behalf{common::kNoUser};
  common::UserId receiver{common::kNoUser};
  std::optional<std::size_t> max_loops{};
};

// `receiver` is only read by withdraw_collateral.
struct CollateralRequest {
  common::UserId caller{common::kNoUser};
  common::AssetId asset{common::kNoAsset};
  common::Amount amount{0};
  common::UserId on_behalf{common::kNoUser};
  common::UserId receiver{common::kNoUser};
};

struct LiquidateRequest {
  common::UserId liquidator{common::kNoUser};
  common::AssetId borrow_asset{common::kNoAsset};
  common::AssetId collateral_asset{common::kNoAsset};
  common::UserId borrower{common::kNoUser};
  common::Amount max_debt_to_cover{0};
};

// Where the processed amount went, in underlying units.
// pool + p2p + delta + idle always equals the processed amount.
struct Split {
  common::Amount pool{0};
  common::Amount p2p{0};
  common::Amount delta{0};
  common::Amount idle{0};

  [[nodiscard]] common::Amount total() const { return pool + p2p + delta + idle; }
};

struct PositionResult {
  common::Error error{common::Error::kNone};
  common::Amount amount{0};   // processed, after capping to the position
  common::Amount on_pool{0};  // scaled, post-state
  common::Amount in_p2p{0};   // scaled, post-state
  Split split{};
  std::size_t loops{0};

  [[nodiscard]] bool ok() const noexcept { return error == common::Error::kNone; }
};

struct CollateralResult {
  common::Error error{common::Error::kNone};
  common::Amount amount{0};
  common::Amount scaled_collateral{0};  // post-state

  [[nodiscard]] bool ok() const noexcept { return error == common::Error::kNone; }
};

struct LiquidationResult {
  common::Error error{common::Error::kNone};
  common::Amount repaid{0};
  common::Amount seized{0};
  common::BasisPoints close_factor{0};

  [[nodiscard]] bool ok() const noexcept { return error == common::Error::kNone; }
};

}  // namespace positions
}  // namespace lendcore
