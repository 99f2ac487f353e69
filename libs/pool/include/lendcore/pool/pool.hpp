#pragma once

#include <cstdint>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace pool {

struct ReserveConfiguration {
  bool borrowing_enabled{true};
  std::uint8_t e_mode_category{0};
  common::Amount supply_cap{0};  // in underlying, 0 = uncapped
  common::Amount borrow_cap{0};  // in underlying, 0 = uncapped
  std::uint8_t decimals{18};
  common::BasisPoints ltv{0};
  common::BasisPoints liquidation_threshold{0};
  common::BasisPoints liquidation_bonus{10'000};  // 10'500 = 5% bonus
};

struct ReserveIndexes {
  common::Amount pool_supply_index{0};  // RAY
  common::Amount pool_borrow_index{0};  // RAY

  friend bool operator==(const ReserveIndexes&, const ReserveIndexes&) = default;
};

// The underlying lending pool. Calls that fail throw; the core never retries.
class Pool {
 public:
  virtual ~Pool() = default;

  virtual void supply(common::AssetId asset, const common::Amount& amount) = 0;
  virtual void withdraw(common::AssetId asset, const common::Amount& amount) = 0;
  virtual void borrow(common::AssetId asset, const common::Amount& amount) = 0;
  virtual void repay(common::AssetId asset, const common::Amount& amount) = 0;

  [[nodiscard]] virtual ReserveConfiguration configuration(common::AssetId asset) const = 0;
  [[nodiscard]] virtual ReserveIndexes reserve_indexes(common::AssetId asset) const = 0;
  [[nodiscard]] virtual common::Amount total_supply(common::AssetId asset) const = 0;
  [[nodiscard]] virtual common::Amount total_borrow(common::AssetId asset) const = 0;
};

// Prices and the liquidation/borrow sentinel.
class PriceOracle {
 public:
  virtual ~PriceOracle() = default;

  // Price of one whole token in the oracle base currency.
  [[nodiscard]] virtual common::Amount price(common::AssetId asset) const = 0;
  [[nodiscard]] virtual bool is_liquidation_allowed() const = 0;
  [[nodiscard]] virtual bool is_borrow_allowed() const = 0;
};

}  // namespace pool
}  // namespace lendcore
