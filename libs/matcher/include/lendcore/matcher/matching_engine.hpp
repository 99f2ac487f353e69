#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/transaction.hpp"

namespace lendcore {
namespace matcher {

enum class Strategy : std::uint8_t {
  kPromoteSuppliers,
  kPromoteBorrowers,
  kDemoteSuppliers,
  kDemoteBorrowers,
};

[[nodiscard]] inline constexpr bool is_demotion(Strategy strategy) noexcept {
  return strategy == Strategy::kDemoteSuppliers || strategy == Strategy::kDemoteBorrowers;
}

[[nodiscard]] inline constexpr common::Side side_of(Strategy strategy) noexcept {
  return (strategy == Strategy::kPromoteSuppliers || strategy == Strategy::kDemoteSuppliers)
             ? common::Side::kSupply
             : common::Side::kBorrow;
}

[[nodiscard]] std::string_view to_string(Strategy strategy) noexcept;

// New scaled position of a user moved by the engine.
struct PositionUpdate {
  common::UserId user{common::kNoUser};
  common::Side side{common::Side::kSupply};
  common::Amount on_pool{0};
  common::Amount in_p2p{0};
};

struct MatchResult {
  common::Amount matched{0};  // in underlying
  std::size_t loops{0};
  std::vector<PositionUpdate> updates{};
};

// Moves users between pool and peer-to-peer buckets, largest balance first.
// Each iteration handles one user; at most `max_loops` iterations run per call.
class MatchingEngine {
 public:
  // Promotes pool users of `side` to peer-to-peer for up to `amount` underlying.
  // No-op when P2P is disabled on the market.
  [[nodiscard]] MatchResult promote(ledger::Transaction& tx,
                                    common::AssetId asset,
                                    common::Side side,
                                    const common::Amount& amount,
                                    std::size_t max_loops) const;

  // Demotes peer-to-peer users of `side` back to the pool.
  [[nodiscard]] MatchResult demote(ledger::Transaction& tx,
                                   common::AssetId asset,
                                   common::Side side,
                                   const common::Amount& amount,
                                   std::size_t max_loops) const;

  [[nodiscard]] MatchResult run(ledger::Transaction& tx,
                                common::AssetId asset,
                                Strategy strategy,
                                const common::Amount& amount,
                                std::size_t max_loops) const;
};

}  // namespace matcher
}  // namespace lendcore
