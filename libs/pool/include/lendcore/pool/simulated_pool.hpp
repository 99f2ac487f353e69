#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/pool/pool.hpp"

namespace lendcore {
namespace pool {

// In-memory pool with caps and liquidity checks. The optimizer's supply and
// debt are held scaled, so they accrue when the owner moves the indexes.
// Seeded liquidity does not accrue.
class SimulatedPool final : public Pool {
 public:
  enum class Action : std::uint8_t {
    kSupply,
    kWithdraw,
    kBorrow,
    kRepay,
  };

  struct Call {
    Action action{Action::kSupply};
    common::AssetId asset{common::kNoAsset};
    common::Amount amount{0};
  };

  void list_reserve(common::AssetId asset, ReserveConfiguration config, ReserveIndexes indexes);
  void set_configuration(common::AssetId asset, ReserveConfiguration config);
  void set_indexes(common::AssetId asset, ReserveIndexes indexes);
  // Liquidity supplied by pool users other than the optimizer.
  void seed_liquidity(common::AssetId asset, const common::Amount& amount);
  // The next call to supply/withdraw/borrow/repay throws std::runtime_error.
  void fail_next_call(std::string reason);

  void supply(common::AssetId asset, const common::Amount& amount) override;
  void withdraw(common::AssetId asset, const common::Amount& amount) override;
  void borrow(common::AssetId asset, const common::Amount& amount) override;
  void repay(common::AssetId asset, const common::Amount& amount) override;

  [[nodiscard]] ReserveConfiguration configuration(common::AssetId asset) const override;
  [[nodiscard]] ReserveIndexes reserve_indexes(common::AssetId asset) const override;
  [[nodiscard]] common::Amount total_supply(common::AssetId asset) const override;
  [[nodiscard]] common::Amount total_borrow(common::AssetId asset) const override;

  // The optimizer's own supply and debt at the current indexes.
  [[nodiscard]] common::Amount supplied_by_optimizer(common::AssetId asset) const;
  [[nodiscard]] common::Amount borrowed_by_optimizer(common::AssetId asset) const;
  [[nodiscard]] const std::vector<Call>& calls() const noexcept { return calls_; }
  void clear_calls() { calls_.clear(); }

 private:
  struct Reserve {
    ReserveConfiguration config{};
    ReserveIndexes indexes{};
    common::Amount seeded{0};
    common::Amount scaled_supplied{0};
    common::Amount scaled_borrowed{0};
  };

  std::unordered_map<common::AssetId, Reserve> reserves_{};
  std::vector<Call> calls_{};
  std::optional<std::string> pending_failure_{};

  Reserve& reserve(common::AssetId asset);
  const Reserve& reserve(common::AssetId asset) const;
  void check_failure();
};

class StaticPriceOracle final : public PriceOracle {
 public:
  void set_price(common::AssetId asset, const common::Amount& price);
  void set_liquidation_allowed(bool allowed) noexcept { liquidation_allowed_ = allowed; }
  void set_borrow_allowed(bool allowed) noexcept { borrow_allowed_ = allowed; }

  [[nodiscard]] common::Amount price(common::AssetId asset) const override;
  [[nodiscard]] bool is_liquidation_allowed() const override { return liquidation_allowed_; }
  [[nodiscard]] bool is_borrow_allowed() const override { return borrow_allowed_; }

 private:
  std::unordered_map<common::AssetId, common::Amount> prices_{};
  bool liquidation_allowed_{true};
  bool borrow_allowed_{true};
};

}  // namespace pool
}  // namespace lendcore
