#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace events {

enum class EventType : std::uint8_t {
  kSupplied,
  kCollateralSupplied,
  kBorrowed,
  kRepaid,
  kWithdrawn,
  kCollateralWithdrawn,
  kLiquidated,
  kPositionUpdated,
  kP2PTotalsUpdated,
  kIndexesUpdated,
  kIdleSupplyUpdated,
  kMarketCreated,
};

[[nodiscard]] std::string_view to_string(EventType type) noexcept;

// One structured record per domain change. Fields not meaningful for a type
// are left zero: `counterparty` is the liquidated borrower or the receiver,
// `related_asset` is the seized collateral asset of a liquidation.
struct Event {
  EventType type{EventType::kSupplied};
  common::UserId actor{common::kNoUser};
  common::UserId target{common::kNoUser};
  common::UserId counterparty{common::kNoUser};
  common::AssetId asset{common::kNoAsset};
  common::AssetId related_asset{common::kNoAsset};
  common::Amount amount{0};
  common::Amount related_amount{0};
  common::Amount on_pool{0};   // scaled, or the collateral balance
  common::Amount in_p2p{0};    // scaled
  common::Side side{common::Side::kSupply};
};

// Single-line rendering used by the daemon.
[[nodiscard]] std::string format(const Event& event);

class EventSink {
 public:
  void push(Event event);
  void push_all(std::vector<Event> events);
  [[nodiscard]] std::vector<Event> drain();
  [[nodiscard]] std::size_t pending() const;

 private:
  mutable std::mutex mutex_;
  std::vector<Event> buffer_{};
};

}  // namespace events
}  // namespace lendcore
