#pragma once

#include <cstdint>

#include "lendcore/common/errors.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/ledger/ledger_state.hpp"
#include "lendcore/risk/risk_engine.hpp"

namespace lendcore {
namespace risk {

inline constexpr common::BasisPoints kDefaultCloseFactor = 5'000;
inline constexpr common::BasisPoints kMaxCloseFactor = 10'000;

// WAD health factors.
[[nodiscard]] common::Amount default_liquidation_threshold();  // 1.0
[[nodiscard]] common::Amount min_liquidation_threshold();      // 0.95

class LiquidationManager {
 public:
  enum class Status : std::uint8_t {
    kHealthy,
    kNeedsPartial,
    kNeedsFull,
  };

  struct Authorization {
    Status status{Status::kHealthy};
    common::Error error{common::Error::kNone};
    common::BasisPoints close_factor{0};
    common::Amount health_factor{0};
  };

  struct SeizeAmounts {
    common::Amount repaid{0};  // borrowed asset units
    common::Amount seized{0};  // collateral asset units
  };

  explicit LiquidationManager(const RiskEngine& engine) : engine_(engine) {}

  // Close factor allowed on `borrower` for a debt in `borrow_market`.
  [[nodiscard]] Authorization authorize(const ledger::LedgerReader& ledger,
                                        const ledger::Market& borrow_market,
                                        common::UserId borrower) const;

  // Collateral paid for repaying `to_repay` of the borrowed asset, including the
  // liquidation bonus. When it exceeds `collateral_balance` the seizure is
  // capped and the repaid amount scaled down accordingly.
  [[nodiscard]] SeizeAmounts seize_amounts(common::AssetId borrow_asset,
                                           common::AssetId collateral_asset,
                                           const common::Amount& to_repay,
                                           const common::Amount& collateral_balance) const;

 private:
  const RiskEngine& engine_;
};

}  // namespace risk
}  // namespace lendcore
