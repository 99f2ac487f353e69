#include "lendcore/events/event_sink.hpp"

#include <iterator>
#include <sstream>
#include <utility>

namespace lendcore {
namespace events {

std::string_view to_string(EventType type) noexcept {
  switch (type) {
    case EventType::kSupplied: return "Supplied";
    case EventType::kCollateralSupplied: return "CollateralSupplied";
    case EventType::kBorrowed: return "Borrowed";
    case EventType::kRepaid: return "Repaid";
    case EventType::kWithdrawn: return "Withdrawn";
    case EventType::kCollateralWithdrawn: return "CollateralWithdrawn";
    case EventType::kLiquidated: return "Liquidated";
    case EventType::kPositionUpdated: return "PositionUpdated";
    case EventType::kP2PTotalsUpdated: return "P2PTotalsUpdated";
    case EventType::kIndexesUpdated: return "IndexesUpdated";
    case EventType::kIdleSupplyUpdated: return "IdleSupplyUpdated";
    case EventType::kMarketCreated: return "MarketCreated";
  }
  return "Unknown";
}

std::string format(const Event& event) {
  std::ostringstream out;
  out << to_string(event.type) << " asset=" << event.asset;
  if (event.actor != common::kNoUser) {
    out << " actor=" << event.actor;
  }
  if (event.target != common::kNoUser) {
    out << " target=" << event.target;
  }
  if (event.counterparty != common::kNoUser) {
    out << " counterparty=" << event.counterparty;
  }

  switch (event.type) {
    case EventType::kPositionUpdated:
      out << " side=" << common::to_string(event.side) << " on_pool=" << event.on_pool
          << " in_p2p=" << event.in_p2p;
      break;
    case EventType::kP2PTotalsUpdated:
      out << " p2p_supply=" << event.on_pool << " p2p_borrow=" << event.in_p2p;
      break;
    case EventType::kIndexesUpdated:
      out << " p2p_supply_index=" << event.on_pool << " p2p_borrow_index=" << event.in_p2p;
      break;
    case EventType::kCollateralSupplied:
    case EventType::kCollateralWithdrawn:
      out << " amount=" << event.amount << " collateral=" << event.on_pool;
      break;
    case EventType::kLiquidated:
      out << " repaid=" << event.amount << " collateral_asset=" << event.related_asset
          << " seized=" << event.related_amount;
      break;
    default:
      out << " amount=" << event.amount << " on_pool=" << event.on_pool << " in_p2p=" << event.in_p2p;
      break;
  }
  return out.str();
}

void EventSink::push(Event event) {
  std::scoped_lock lock(mutex_);
  buffer_.push_back(std::move(event));
}

void EventSink::push_all(std::vector<Event> events) {
  std::scoped_lock lock(mutex_);
  buffer_.insert(buffer_.end(), std::make_move_iterator(events.begin()), std::make_move_iterator(events.end()));
}

std::vector<Event> EventSink::drain() {
  std::scoped_lock lock(mutex_);
  auto copy = std::move(buffer_);
  buffer_.clear();
  return copy;
}

std::size_t EventSink::pending() const {
  std::scoped_lock lock(mutex_);
  return buffer_.size();
}

}  // namespace events
}  // namespace lendcore
