#pragma once

#include <optional>

#include "lendcore/common/errors.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/ledger/ledger_state.hpp"
#include "lendcore/pool/pool.hpp"

namespace lendcore {
namespace risk {

// Values are in the oracle base currency.
struct LiquidityData {
  common::Amount borrowable{0};  // collateral value weighted by LTV
  common::Amount max_debt{0};    // collateral value weighted by the liquidation threshold
  common::Amount debt{0};
};

// Collateral removed from the user before the liquidity is computed.
struct CollateralDelta {
  common::AssetId asset{common::kNoAsset};
  common::Amount withdrawn{0};
};

// Health factor of an account with no debt.
[[nodiscard]] common::Amount max_health_factor();

// 10^decimals.
[[nodiscard]] common::Amount token_unit(std::uint8_t decimals);

class RiskEngine {
 public:
  RiskEngine(const pool::Pool& pool, const pool::PriceOracle& oracle) : pool_(pool), oracle_(oracle) {}

  // Balances in underlying units, from the indexes stored in the market.
  [[nodiscard]] common::Amount supply_balance(const ledger::LedgerReader& ledger,
                                              common::AssetId asset,
                                              common::UserId user) const;
  [[nodiscard]] common::Amount borrow_balance(const ledger::LedgerReader& ledger,
                                              common::AssetId asset,
                                              common::UserId user) const;
  [[nodiscard]] common::Amount collateral_balance(const ledger::LedgerReader& ledger,
                                                  common::AssetId asset,
                                                  common::UserId user) const;

  [[nodiscard]] LiquidityData liquidity_data(const ledger::LedgerReader& ledger, common::UserId user) const;
  [[nodiscard]] LiquidityData liquidity_data_with_delta(const ledger::LedgerReader& ledger,
                                                        common::UserId user,
                                                        std::optional<CollateralDelta> delta) const;

  [[nodiscard]] static common::Amount health_factor(const LiquidityData& data);
  [[nodiscard]] common::Amount health_factor(const ledger::LedgerReader& ledger, common::UserId user) const;

  // kUnauthorizedBorrow when the current debt plus `amount` of `asset`
  // exceeds what the collateral allows to borrow.
  [[nodiscard]] common::Error authorize_borrow(const ledger::LedgerReader& ledger,
                                               common::UserId user,
                                               common::AssetId asset,
                                               const common::Amount& amount) const;

  // kUnauthorizedWithdraw when withdrawing `amount` of collateral would put the
  // health factor below one.
  [[nodiscard]] common::Error authorize_withdraw_collateral(const ledger::LedgerReader& ledger,
                                                            common::UserId user,
                                                            common::AssetId asset,
                                                            const common::Amount& amount) const;

  [[nodiscard]] const pool::Pool& pool() const noexcept { return pool_; }
  [[nodiscard]] const pool::PriceOracle& oracle() const noexcept { return oracle_; }

 private:
  const pool::Pool& pool_;
  const pool::PriceOracle& oracle_;
};

}  // namespace risk
}  // namespace lendcore
