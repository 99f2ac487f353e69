#pragma once

#include <cstdint>
#include <string_view>

namespace lendcore {
namespace common {

// Business failures reported by the core. Collaborator failures are not listed
// here: they surface as exceptions thrown by the pool or the oracle.
enum class Error : std::uint16_t {
  kNone = 0,

  // Validation
  kAddressIsZero = 1001,
  kAmountIsZero = 1002,
  kMarketNotCreated = 1003,
  kSupplyIsZero = 1004,
  kDebtIsZero = 1005,
  kCollateralIsZero = 1006,
  kExceedsMaxBasisPoints = 1007,

  // Policy
  kSupplyIsPaused = 2001,
  kBorrowIsPaused = 2002,
  kRepayIsPaused = 2003,
  kWithdrawIsPaused = 2004,
  kSupplyCollateralIsPaused = 2005,
  kWithdrawCollateralIsPaused = 2006,
  kLiquidateCollateralIsPaused = 2007,
  kLiquidateBorrowIsPaused = 2008,
  kBorrowNotEnabled = 2009,
  kInconsistentEMode = 2010,
  kExceedsBorrowCap = 2011,
  kAssetNotCollateral = 2012,
  kBorrowNotPaused = 2013,
  kMarketIsDeprecated = 2014,

  // Authorization
  kPermissionDenied = 3001,
  kUnauthorizedBorrow = 3002,
  kUnauthorizedWithdraw = 3003,
  kUnauthorizedLiquidate = 3004,
  kSentinelLiquidateNotEnabled = 3005,
  kSentinelBorrowNotEnabled = 3006,
};

enum class ErrorCategory : std::uint8_t {
  kNone,
  kValidation,
  kPolicy,
  kAuthorization,
};

[[nodiscard]] inline constexpr ErrorCategory error_category(Error error) noexcept {
  const auto code = static_cast<std::uint16_t>(error);
  if (code == 0) {
    return ErrorCategory::kNone;
  }
  if (code < 2000) {
    return ErrorCategory::kValidation;
  }
  if (code < 3000) {
    return ErrorCategory::kPolicy;
  }
  return ErrorCategory::kAuthorization;
}

[[nodiscard]] inline constexpr std::string_view to_string(Error error) noexcept {
  switch (error) {
    case Error::kNone: return "none";
    case Error::kAddressIsZero: return "address is zero";
    case Error::kAmountIsZero: return "amount is zero";
    case Error::kMarketNotCreated: return "market not created";
    case Error::kSupplyIsZero: return "supply is zero";
    case Error::kDebtIsZero: return "debt is zero";
    case Error::kCollateralIsZero: return "collateral is zero";
    case Error::kExceedsMaxBasisPoints: return "exceeds max basis points";
    case Error::kSupplyIsPaused: return "supply is paused";
    case Error::kBorrowIsPaused: return "borrow is paused";
    case Error::kRepayIsPaused: return "repay is paused";
    case Error::kWithdrawIsPaused: return "withdraw is paused";
    case Error::kSupplyCollateralIsPaused: return "supply collateral is paused";
    case Error::kWithdrawCollateralIsPaused: return "withdraw collateral is paused";
    case Error::kLiquidateCollateralIsPaused: return "liquidate collateral is paused";
    case Error::kLiquidateBorrowIsPaused: return "liquidate borrow is paused";
    case Error::kBorrowNotEnabled: return "borrow not enabled";
    case Error::kInconsistentEMode: return "inconsistent e-mode";
    case Error::kExceedsBorrowCap: return "exceeds borrow cap";
    case Error::kAssetNotCollateral: return "asset not collateral";
    case Error::kBorrowNotPaused: return "borrow not paused";
    case Error::kMarketIsDeprecated: return "market is deprecated";
    case Error::kPermissionDenied: return "permission denied";
    case Error::kUnauthorizedBorrow: return "unauthorized borrow";
    case Error::kUnauthorizedWithdraw: return "unauthorized withdraw";
    case Error::kUnauthorizedLiquidate: return "unauthorized liquidate";
    case Error::kSentinelLiquidateNotEnabled: return "sentinel liquidate not enabled";
    case Error::kSentinelBorrowNotEnabled: return "sentinel borrow not enabled";
  }
  return "unknown";
}

}  // namespace common
}  // namespace lendcore
