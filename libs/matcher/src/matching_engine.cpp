#include "lendcore/matcher/matching_engine.hpp"

#include "lendcore/common/math.hpp"
#include "lendcore/delta/delta_accounting.hpp"

namespace lendcore {
namespace matcher {

namespace math = common::math;
using common::Amount;

std::string_view to_string(Strategy strategy) noexcept {
  switch (strategy) {
    case Strategy::kPromoteSuppliers: return "promote-suppliers";
    case Strategy::kPromoteBorrowers: return "promote-borrowers";
    case Strategy::kDemoteSuppliers: return "demote-suppliers";
    case Strategy::kDemoteBorrowers: return "demote-borrowers";
  }
  return "unknown";
}

MatchResult MatchingEngine::promote(ledger::Transaction& tx,
                                    common::AssetId asset,
                                    common::Side side,
                                    const Amount& amount,
                                    std::size_t max_loops) const {
  return run(tx, asset, side == common::Side::kSupply ? Strategy::kPromoteSuppliers : Strategy::kPromoteBorrowers,
             amount, max_loops);
}

MatchResult MatchingEngine::demote(ledger::Transaction& tx,
                                   common::AssetId asset,
                                   common::Side side,
                                   const Amount& amount,
                                   std::size_t max_loops) const {
  return run(tx, asset, side == common::Side::kSupply ? Strategy::kDemoteSuppliers : Strategy::kDemoteBorrowers,
             amount, max_loops);
}

MatchResult MatchingEngine::run(ledger::Transaction& tx,
                                common::AssetId asset,
                                Strategy strategy,
                                const Amount& amount,
                                std::size_t max_loops) const {
  MatchResult result;
  if (amount == 0 || max_loops == 0) {
    return result;
  }

  const bool demoting = is_demotion(strategy);
  const common::Side side = side_of(strategy);
  const ledger::Market& market = tx.market(asset);
  if (!demoting && market.is_p2p_disabled) {
    return result;
  }

  const common::MarketSideIndexes indexes = market.indexes.of(side);
  const ledger::Bucket pool_bucket = ledger::pool_bucket(side);
  const ledger::Bucket p2p_bucket = ledger::p2p_bucket(side);
  const ledger::Bucket working = demoting ? p2p_bucket : pool_bucket;

  Amount remaining = amount;
  while (result.loops < max_loops && remaining != 0) {
    const common::UserId user = tx.ranking(asset, working).head();
    if (user == common::kNoUser) {
      break;
    }

    const ledger::UserMarketBalance balance = tx.balance(asset, user);
    Amount on_pool = balance.of(pool_bucket);
    Amount in_p2p = balance.of(p2p_bucket);

    Amount to_process;
    if (demoting) {
      to_process = math::min(delta::unscale(in_p2p, indexes.p2p_index, side), remaining);
      on_pool += delta::scale_credit(to_process, indexes.pool_index);
      in_p2p = math::zero_floor_sub(in_p2p, delta::scale_debit(to_process, indexes.p2p_index));
    } else {
      to_process = math::min(delta::unscale(on_pool, indexes.pool_index, side), remaining);
      on_pool = math::zero_floor_sub(on_pool, delta::scale_debit(to_process, indexes.pool_index));
      in_p2p += delta::scale_credit(to_process, indexes.p2p_index);
    }

    // A head worth less than one unit cannot move; the next call retries it.
    if (to_process == 0) {
      break;
    }
    remaining -= to_process;

    tx.set_scaled(asset, user, pool_bucket, on_pool);
    tx.set_scaled(asset, user, p2p_bucket, in_p2p);
    result.updates.push_back(PositionUpdate{.user = user, .side = side, .on_pool = on_pool, .in_p2p = in_p2p});
    ++result.loops;
  }

  result.matched = amount - remaining;
  return result;
}

}  // namespace matcher
}  // namespace lendcore
