#include "lendcore/pool/simulated_pool.hpp"

#include <stdexcept>
#include <utility>

#include "lendcore/common/math.hpp"

namespace lendcore {
namespace pool {

namespace math = common::math;

void SimulatedPool::list_reserve(common::AssetId asset, ReserveConfiguration config, ReserveIndexes indexes) {
  if (indexes.pool_supply_index == 0 || indexes.pool_borrow_index == 0) {
    throw std::invalid_argument("pool: reserve indexes must be positive");
  }
  auto& entry = reserves_[asset];
  entry.config = config;
  entry.indexes = indexes;
}

void SimulatedPool::set_configuration(common::AssetId asset, ReserveConfiguration config) {
  reserve(asset).config = config;
}

void SimulatedPool::set_indexes(common::AssetId asset, ReserveIndexes indexes) {
  if (indexes.pool_supply_index == 0 || indexes.pool_borrow_index == 0) {
    throw std::invalid_argument("pool: reserve indexes must be positive");
  }
  reserve(asset).indexes = indexes;
}

void SimulatedPool::seed_liquidity(common::AssetId asset, const common::Amount& amount) {
  reserve(asset).seeded += amount;
}

void SimulatedPool::fail_next_call(std::string reason) {
  pending_failure_ = std::move(reason);
}

void SimulatedPool::supply(common::AssetId asset, const common::Amount& amount) {
  check_failure();
  auto& entry = reserve(asset);
  if (entry.config.supply_cap != 0 && total_supply(asset) + amount > entry.config.supply_cap) {
    throw std::runtime_error("pool: supply cap exceeded");
  }
  entry.scaled_supplied += math::ray_div_down(amount, entry.indexes.pool_supply_index);
  calls_.push_back(Call{.action = Action::kSupply, .asset = asset, .amount = amount});
}

void SimulatedPool::withdraw(common::AssetId asset, const common::Amount& amount) {
  check_failure();
  auto& entry = reserve(asset);
  // Withdrawals are checked against the balance rounded up, as the optimizer
  // releases its pool deltas rounding up.
  if (amount > math::ray_mul_up(entry.scaled_supplied, entry.indexes.pool_supply_index)) {
    throw std::runtime_error("pool: withdraw exceeds optimizer supply");
  }
  if (math::zero_floor_sub(total_supply(asset), amount) < total_borrow(asset)) {
    throw std::runtime_error("pool: not enough liquidity to withdraw");
  }
  entry.scaled_supplied =
      math::zero_floor_sub(entry.scaled_supplied, math::ray_div_up(amount, entry.indexes.pool_supply_index));
  calls_.push_back(Call{.action = Action::kWithdraw, .asset = asset, .amount = amount});
}

void SimulatedPool::borrow(common::AssetId asset, const common::Amount& amount) {
  check_failure();
  auto& entry = reserve(asset);
  if (!entry.config.borrowing_enabled) {
    throw std::runtime_error("pool: borrowing disabled");
  }
  if (entry.config.borrow_cap != 0 && total_borrow(asset) + amount > entry.config.borrow_cap) {
    throw std::runtime_error("pool: borrow cap exceeded");
  }
  if (total_borrow(asset) + amount > total_supply(asset)) {
    throw std::runtime_error("pool: not enough liquidity to borrow");
  }
  entry.scaled_borrowed += math::ray_div_up(amount, entry.indexes.pool_borrow_index);
  calls_.push_back(Call{.action = Action::kBorrow, .asset = asset, .amount = amount});
}

void SimulatedPool::repay(common::AssetId asset, const common::Amount& amount) {
  check_failure();
  auto& entry = reserve(asset);
  entry.scaled_borrowed =
      math::zero_floor_sub(entry.scaled_borrowed, math::ray_div_down(amount, entry.indexes.pool_borrow_index));
  calls_.push_back(Call{.action = Action::kRepay, .asset = asset, .amount = amount});
}

ReserveConfiguration SimulatedPool::configuration(common::AssetId asset) const {
  return reserve(asset).config;
}

ReserveIndexes SimulatedPool::reserve_indexes(common::AssetId asset) const {
  return reserve(asset).indexes;
}

common::Amount SimulatedPool::total_supply(common::AssetId asset) const {
  return reserve(asset).seeded + supplied_by_optimizer(asset);
}

common::Amount SimulatedPool::total_borrow(common::AssetId asset) const {
  return borrowed_by_optimizer(asset);
}

common::Amount SimulatedPool::supplied_by_optimizer(common::AssetId asset) const {
  const auto& entry = reserve(asset);
  return math::ray_mul_down(entry.scaled_supplied, entry.indexes.pool_supply_index);
}

common::Amount SimulatedPool::borrowed_by_optimizer(common::AssetId asset) const {
  const auto& entry = reserve(asset);
  return math::ray_mul_up(entry.scaled_borrowed, entry.indexes.pool_borrow_index);
}

SimulatedPool::Reserve& SimulatedPool::reserve(common::AssetId asset) {
  auto it = reserves_.find(asset);
  if (it == reserves_.end()) {
    throw std::out_of_range("pool: reserve " + std::to_string(asset) + " is not listed");
  }
  return it->second;
}

const SimulatedPool::Reserve& SimulatedPool::reserve(common::AssetId asset) const {
  auto it = reserves_.find(asset);
  if (it == reserves_.end()) {
    throw std::out_of_range("pool: reserve " + std::to_string(asset) + " is not listed");
  }
  return it->second;
}

void SimulatedPool::check_failure() {
  if (pending_failure_) {
    auto reason = std::move(*pending_failure_);
    pending_failure_.reset();
    throw std::runtime_error("pool: " + reason);
  }
}

void StaticPriceOracle::set_price(common::AssetId asset, const common::Amount& price) {
  prices_[asset] = price;
}

common::Amount StaticPriceOracle::price(common::AssetId asset) const {
  auto it = prices_.find(asset);
  if (it == prices_.end()) {
    throw std::out_of_range("oracle: no price for asset " + std::to_string(asset));
  }
  return it->second;
}

}  // namespace pool
}  // namespace lendcore
