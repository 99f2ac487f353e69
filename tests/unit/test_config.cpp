#include "test_config.hpp"

#include <algorithm>
#include <cassert>
#include <string>

#include "lendcore/config/config_loader.hpp"

namespace lendcore::tests {

namespace {

bool has_error(const config::LoadResult& result, const std::string& field) {
  return std::any_of(result.errors.begin(), result.errors.end(),
                     [&field](const config::ValidationError& error) { return error.field == field; });
}

}  // namespace

void test_default_config() {
  const auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  assert(result.raw_error.empty());
  assert(result.success);
  assert(result.errors.empty());

  const auto& cfg = result.config;
  assert(cfg.engine.max_sorted_users == 16);
  assert(cfg.markets.size() == 2);
  assert(cfg.markets[0].symbol == "USDC");
  assert(cfg.markets[1].asset == 2);
  assert(cfg.markets[1].decimals == 18);
  assert(cfg.markets[1].seed_liquidity == common::Amount{"1000000000000000000000"});
  assert(cfg.scenario.size() == 5);
  assert(cfg.scenario[1].op == "supply_collateral");
  assert(cfg.scenario[1].on_behalf == 2);

  const auto manager = config::to_manager_config(cfg);
  assert(manager.max_sorted_users == 16);
  assert(manager.default_iterations.repay == 10);
}

void test_config_values() {
  const auto result = config::ConfigLoader::load_from_string(R"(
[engine]
max_sorted_users = 32
e_mode_category = 1

[engine.default_iterations]
supply = 4
withdraw = 7

[oracle]
borrow_allowed = false

[[markets]]
asset = 5
symbol = "DAI"
decimals = 18
price = 100000000
pool_supply_index = "1050000000000000000000000000"
supply_cap = "5000000000000000000000"
reserve_factor_bp = 0
e_mode_category = 1
is_collateral = false

[[scenario]]
op = "approve_manager"
user = 1
manager = 9
approved = false

[[scenario]]
op = "borrow"
user = 9
on_behalf = 1
asset = 5
amount = 10
max_loops = 2
)");
  assert(result.success);

  const auto& cfg = result.config;
  assert(cfg.engine.max_sorted_users == 32);
  assert(cfg.engine.e_mode_category == 1);
  assert(cfg.engine.default_iterations.supply == 4);
  assert(cfg.engine.default_iterations.borrow == 10);
  assert(cfg.engine.default_iterations.withdraw == 7);
  assert(!cfg.oracle.borrow_allowed);
  assert(cfg.oracle.liquidation_allowed);

  const auto& market = cfg.markets.front();
  assert(market.asset == 5);
  assert(market.pool_supply_index == common::Amount{"1050000000000000000000000000"});
  assert(market.pool_borrow_index == common::Amount{"1000000000000000000000000000"});
  assert(market.supply_cap == common::Amount{"5000000000000000000000"});
  assert(market.reserve_factor == 0);
  assert(market.ltv == 8'000);
  assert(!market.is_collateral);

  assert(!cfg.scenario[0].approved);
  assert(cfg.scenario[0].manager == 9);
  assert(cfg.scenario[1].on_behalf == 1);
  assert(cfg.scenario[1].max_loops.has_value());
  assert(*cfg.scenario[1].max_loops == 2);
}

void test_config_validation() {
  const auto result = config::ConfigLoader::load_from_string(R"(
[engine]
max_sorted_users = 0

[[markets]]
asset = 1
price = 0
ltv_bp = 9000
liquidation_threshold_bp = 8500
liquidation_bonus_bp = 9000

[[markets]]
asset = 1
reserve_factor_bp = 20000
supply_cap = "12abc"

[[scenario]]
op = "flash_loan"
user = 1
asset = 1

[[scenario]]
op = "supply"
asset = 3
amount = 1

[[scenario]]
op = "liquidate"
user = 4
asset = 1
)");
  assert(!result.success);
  assert(result.raw_error.empty());

  assert(has_error(result, "engine.max_sorted_users"));
  assert(has_error(result, "markets[0].price"));
  assert(has_error(result, "markets[0].ltv_bp"));
  assert(has_error(result, "markets[0].liquidation_bonus_bp"));
  assert(has_error(result, "markets[1].asset"));
  assert(has_error(result, "markets[1].reserve_factor_bp"));
  assert(has_error(result, "markets[1].supply_cap"));
  assert(has_error(result, "scenario[0].op"));
  assert(has_error(result, "scenario[1].user"));
  assert(has_error(result, "scenario[1].asset"));
  assert(has_error(result, "scenario[2].collateral_asset"));
  assert(has_error(result, "scenario[2].borrower"));

  config::EngineConfig empty;
  const auto errors = config::ConfigLoader::validate(empty);
  assert(errors.size() == 1);
  assert(errors.front().field == "markets");
}

void test_config_out_of_range() {
  const auto result = config::ConfigLoader::load_from_string(R"(
[engine]
max_sorted_users = -1

[engine.default_iterations]
borrow = -5

[[markets]]
asset = 1
ltv_bp = 70000
decimals = 300
e_mode_category = -1

[[scenario]]
op = "supply"
user = 1
asset = 1
amount = 5
max_loops = -3
)");
  assert(!result.success);
  assert(has_error(result, "engine.max_sorted_users"));
  assert(has_error(result, "engine.default_iterations.borrow"));
  assert(has_error(result, "markets[0].ltv_bp"));
  assert(has_error(result, "markets[0].decimals"));
  assert(has_error(result, "markets[0].e_mode_category"));
  assert(has_error(result, "scenario[0].max_loops"));

  // Rejected values are not wrapped into the parsed config.
  const auto& cfg = result.config;
  assert(cfg.engine.max_sorted_users == 16);
  assert(cfg.engine.default_iterations.borrow == 10);
  assert(cfg.markets[0].ltv == 8'000);
  assert(cfg.markets[0].decimals == 6);
}

void test_config_parse_error() {
  const auto result = config::ConfigLoader::load_from_string("[engine\nmax_sorted_users = ");
  assert(!result.success);
  assert(!result.raw_error.empty());

  const auto missing = config::ConfigLoader::load("/nonexistent/lendcore.toml");
  assert(!missing.success);
  assert(missing.raw_error.find("not found") != std::string::npos);
}

}  // namespace lendcore::tests
