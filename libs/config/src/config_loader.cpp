#include "lendcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <set>
#include <sstream>

#include "lendcore/common/math.hpp"

namespace lendcore {
namespace config {

namespace {

// Integer fields are narrowed only when they fit; anything else is reported
// against `field` and the default is kept.
template <typename T>
T get_uint_or(const toml::table& tbl,
              std::string_view key,
              T default_val,
              const std::string& field,
              std::vector<ValidationError>& errors) {
  const auto val = tbl[key].value<std::int64_t>();
  if (!val) {
    return default_val;
  }
  if (*val < 0 ||
      static_cast<std::uint64_t>(*val) > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
    errors.push_back({field, "out of range"});
    return default_val;
  }
  return static_cast<T>(*val);
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

// Amounts exceed the TOML integer range, so they may also be given as decimal strings.
common::Amount get_amount_or(const toml::table& tbl,
                             std::string_view key,
                             const common::Amount& default_val,
                             const std::string& field,
                             std::vector<ValidationError>& errors) {
  const auto node = tbl[key];
  if (auto val = node.value<std::int64_t>()) {
    if (*val < 0) {
      errors.push_back({field, "must not be negative"});
      return default_val;
    }
    return common::Amount{*val};
  }
  if (auto val = node.value<std::string_view>()) {
    const std::string_view digits = *val;
    if (digits.empty() || digits.size() > 78 ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
      errors.push_back({field, "must be a decimal integer"});
      return default_val;
    }
    return common::Amount{std::string(digits)};
  }
  return default_val;
}

EngineSection parse_engine(const toml::table& root, std::vector<ValidationError>& errors) {
  EngineSection cfg;
  if (auto* engine = root["engine"].as_table()) {
    cfg.max_sorted_users =
        get_uint_or(*engine, "max_sorted_users", cfg.max_sorted_users, "engine.max_sorted_users", errors);
    cfg.e_mode_category =
        get_uint_or(*engine, "e_mode_category", cfg.e_mode_category, "engine.e_mode_category", errors);

    if (auto* iterations = (*engine)["default_iterations"].as_table()) {
      const std::string prefix = "engine.default_iterations.";
      auto& it = cfg.default_iterations;
      it.supply = get_uint_or(*iterations, "supply", it.supply, prefix + "supply", errors);
      it.borrow = get_uint_or(*iterations, "borrow", it.borrow, prefix + "borrow", errors);
      it.repay = get_uint_or(*iterations, "repay", it.repay, prefix + "repay", errors);
      it.withdraw = get_uint_or(*iterations, "withdraw", it.withdraw, prefix + "withdraw", errors);
    }
  }
  return cfg;
}

OracleConfig parse_oracle(const toml::table& root) {
  OracleConfig cfg;
  if (auto* oracle = root["oracle"].as_table()) {
    cfg.liquidation_allowed = get_bool_or(*oracle, "liquidation_allowed", cfg.liquidation_allowed);
    cfg.borrow_allowed = get_bool_or(*oracle, "borrow_allowed", cfg.borrow_allowed);
  }
  return cfg;
}

std::vector<MarketConfig> parse_markets(const toml::table& root, std::vector<ValidationError>& errors) {
  std::vector<MarketConfig> markets;
  auto* arr = root["markets"].as_array();
  if (!arr) {
    return markets;
  }

  for (std::size_t i = 0; i < arr->size(); ++i) {
    auto* tbl = arr->get(i)->as_table();
    if (!tbl) {
      continue;
    }
    const std::string prefix = "markets[" + std::to_string(i) + "]";

    MarketConfig market;
    market.asset = get_uint_or(*tbl, "asset", market.asset, prefix + ".asset", errors);
    market.symbol = get_str_or(*tbl, "symbol", market.symbol);
    market.decimals = get_uint_or(*tbl, "decimals", market.decimals, prefix + ".decimals", errors);
    market.price = get_amount_or(*tbl, "price", market.price, prefix + ".price", errors);
    market.pool_supply_index =
        get_amount_or(*tbl, "pool_supply_index", market.pool_supply_index, prefix + ".pool_supply_index", errors);
    market.pool_borrow_index =
        get_amount_or(*tbl, "pool_borrow_index", market.pool_borrow_index, prefix + ".pool_borrow_index", errors);
    market.ltv = get_uint_or(*tbl, "ltv_bp", market.ltv, prefix + ".ltv_bp", errors);
    market.liquidation_threshold = get_uint_or(*tbl, "liquidation_threshold_bp", market.liquidation_threshold,
                                               prefix + ".liquidation_threshold_bp", errors);
    market.liquidation_bonus = get_uint_or(*tbl, "liquidation_bonus_bp", market.liquidation_bonus,
                                           prefix + ".liquidation_bonus_bp", errors);
    market.supply_cap = get_amount_or(*tbl, "supply_cap", market.supply_cap, prefix + ".supply_cap", errors);
    market.borrow_cap = get_amount_or(*tbl, "borrow_cap", market.borrow_cap, prefix + ".borrow_cap", errors);
    market.seed_liquidity =
        get_amount_or(*tbl, "seed_liquidity", market.seed_liquidity, prefix + ".seed_liquidity", errors);
    market.reserve_factor =
        get_uint_or(*tbl, "reserve_factor_bp", market.reserve_factor, prefix + ".reserve_factor_bp", errors);
    market.p2p_index_cursor =
        get_uint_or(*tbl, "p2p_index_cursor_bp", market.p2p_index_cursor, prefix + ".p2p_index_cursor_bp", errors);
    market.e_mode_category =
        get_uint_or(*tbl, "e_mode_category", market.e_mode_category, prefix + ".e_mode_category", errors);
    market.borrowing_enabled = get_bool_or(*tbl, "borrowing_enabled", market.borrowing_enabled);
    market.is_collateral = get_bool_or(*tbl, "is_collateral", market.is_collateral);

    markets.push_back(std::move(market));
  }
  return markets;
}

std::vector<ScenarioStep> parse_scenario(const toml::table& root, std::vector<ValidationError>& errors) {
  std::vector<ScenarioStep> steps;
  auto* arr = root["scenario"].as_array();
  if (!arr) {
    return steps;
  }

  for (std::size_t i = 0; i < arr->size(); ++i) {
    auto* tbl = arr->get(i)->as_table();
    if (!tbl) {
      continue;
    }
    const std::string prefix = "scenario[" + std::to_string(i) + "]";

    ScenarioStep step;
    step.op = get_str_or(*tbl, "op", "");
    step.user = get_uint_or<common::UserId>(*tbl, "user", common::kNoUser, prefix + ".user", errors);
    step.on_behalf = get_uint_or(*tbl, "on_behalf", step.user, prefix + ".on_behalf", errors);
    step.borrower = get_uint_or<common::UserId>(*tbl, "borrower", common::kNoUser, prefix + ".borrower", errors);
    step.manager = get_uint_or<common::UserId>(*tbl, "manager", common::kNoUser, prefix + ".manager", errors);
    step.asset = get_uint_or<common::AssetId>(*tbl, "asset", common::kNoAsset, prefix + ".asset", errors);
    step.collateral_asset =
        get_uint_or<common::AssetId>(*tbl, "collateral_asset", common::kNoAsset, prefix + ".collateral_asset", errors);
    step.amount = get_amount_or(*tbl, "amount", step.amount, prefix + ".amount", errors);
    step.price = get_amount_or(*tbl, "price", step.price, prefix + ".price", errors);
    step.pool_supply_index =
        get_amount_or(*tbl, "pool_supply_index", step.pool_supply_index, prefix + ".pool_supply_index", errors);
    step.pool_borrow_index =
        get_amount_or(*tbl, "pool_borrow_index", step.pool_borrow_index, prefix + ".pool_borrow_index", errors);
    if ((*tbl)["max_loops"].is_integer()) {
      step.max_loops = get_uint_or<std::size_t>(*tbl, "max_loops", 0, prefix + ".max_loops", errors);
    }
    step.approved = get_bool_or(*tbl, "approved", step.approved);

    steps.push_back(std::move(step));
  }
  return steps;
}

EngineConfig parse_config(const toml::table& root, std::vector<ValidationError>& errors) {
  EngineConfig cfg;
  cfg.engine = parse_engine(root, errors);
  cfg.oracle = parse_oracle(root);
  cfg.markets = parse_markets(root, errors);
  cfg.scenario = parse_scenario(root, errors);
  return cfg;
}

LoadResult finish(const toml::table& root) {
  LoadResult result;
  std::vector<ValidationError> errors;
  result.config = parse_config(root, errors);

  auto semantic = ConfigLoader::validate(result.config);
  errors.insert(errors.end(), semantic.begin(), semantic.end());
  result.errors = std::move(errors);
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;
  const auto max_bp = common::math::kPercentageFactor;

  if (config.engine.max_sorted_users == 0) {
    errors.push_back({"engine.max_sorted_users", "must be greater than 0"});
  }

  if (config.markets.empty()) {
    errors.push_back({"markets", "at least one market is required"});
  }

  std::set<common::AssetId> assets;
  for (std::size_t i = 0; i < config.markets.size(); ++i) {
    const auto& market = config.markets[i];
    const std::string prefix = "markets[" + std::to_string(i) + "]";

    if (market.asset == common::kNoAsset) {
      errors.push_back({prefix + ".asset", "asset id must be greater than 0"});
    } else if (!assets.insert(market.asset).second) {
      errors.push_back({prefix + ".asset", "duplicate asset id"});
    }

    if (market.decimals > 36) {
      errors.push_back({prefix + ".decimals", "must be at most 36"});
    }

    if (market.price == 0) {
      errors.push_back({prefix + ".price", "must be positive"});
    }

    if (market.pool_supply_index == 0 || market.pool_borrow_index == 0) {
      errors.push_back({prefix + ".pool_index", "pool indexes must be positive"});
    }

    if (market.ltv > market.liquidation_threshold) {
      errors.push_back({prefix + ".ltv_bp", "must be <= liquidation_threshold_bp"});
    }

    if (market.liquidation_threshold > max_bp) {
      errors.push_back({prefix + ".liquidation_threshold_bp", "must be at most 10000"});
    }

    if (market.liquidation_bonus < max_bp) {
      errors.push_back({prefix + ".liquidation_bonus_bp", "must be at least 10000"});
    }

    if (market.reserve_factor > max_bp) {
      errors.push_back({prefix + ".reserve_factor_bp", "must be at most 10000"});
    }

    if (market.p2p_index_cursor > max_bp) {
      errors.push_back({prefix + ".p2p_index_cursor_bp", "must be at most 10000"});
    }
  }

  for (std::size_t i = 0; i < config.scenario.size(); ++i) {
    const auto& step = config.scenario[i];
    const std::string prefix = "scenario[" + std::to_string(i) + "]";

    if (std::find(std::begin(kScenarioOps), std::end(kScenarioOps), step.op) == std::end(kScenarioOps)) {
      errors.push_back({prefix + ".op", "unknown operation '" + step.op + "'"});
      continue;
    }

    const bool needs_user = step.op != "set_price" && step.op != "set_pool_indexes" && step.op != "update_indexes";
    if (needs_user && step.user == common::kNoUser) {
      errors.push_back({prefix + ".user", "must be greater than 0"});
    }

    if (step.op != "approve_manager" && !assets.contains(step.asset)) {
      errors.push_back({prefix + ".asset", "asset is not a configured market"});
    }

    if (step.op == "approve_manager" && step.manager == common::kNoUser) {
      errors.push_back({prefix + ".manager", "must be greater than 0"});
    }

    if (step.op == "set_price" && step.price == 0) {
      errors.push_back({prefix + ".price", "must be positive"});
    }

    if (step.op == "set_pool_indexes" && (step.pool_supply_index == 0 || step.pool_borrow_index == 0)) {
      errors.push_back({prefix + ".pool_index", "pool indexes must be positive"});
    }

    if (step.op == "liquidate") {
      if (!assets.contains(step.collateral_asset)) {
        errors.push_back({prefix + ".collateral_asset", "asset is not a configured market"});
      }
      if (step.borrower == common::kNoUser) {
        errors.push_back({prefix + ".borrower", "must be greater than 0"});
      }
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# lendcore configuration
# Generated default configuration

[engine]
max_sorted_users = 16
e_mode_category = 0

[engine.default_iterations]
supply = 10
borrow = 10
repay = 10
withdraw = 10

[oracle]
liquidation_allowed = true
borrow_allowed = true

[[markets]]
asset = 1
symbol = "USDC"
decimals = 6
price = 100000000                  # $1.00, 8 decimals
ltv_bp = 8000
liquidation_threshold_bp = 8500
liquidation_bonus_bp = 10500
reserve_factor_bp = 1000
p2p_index_cursor_bp = 3333
seed_liquidity = 1000000000000     # 1,000,000 USDC
is_collateral = true

[[markets]]
asset = 2
symbol = "WETH"
decimals = 18
price = 200000000000               # $2,000.00
ltv_bp = 8000
liquidation_threshold_bp = 8250
liquidation_bonus_bp = 10500
reserve_factor_bp = 1500
p2p_index_cursor_bp = 3333
seed_liquidity = "1000000000000000000000"
is_collateral = true

[[scenario]]
op = "supply"
user = 1
asset = 1
amount = 1000000000                # 1,000 USDC

[[scenario]]
op = "supply_collateral"
user = 2
asset = 2
amount = "1000000000000000000"     # 1 WETH

[[scenario]]
op = "borrow"
user = 2
asset = 1
amount = 500000000

[[scenario]]
op = "repay"
user = 2
asset = 1
amount = 500000000

[[scenario]]
op = "withdraw"
user = 1
asset = 1
amount = 1000000000
)";
}

positions::ManagerConfig to_manager_config(const EngineConfig& config) {
  return positions::ManagerConfig{
      .max_sorted_users = config.engine.max_sorted_users,
      .default_iterations = config.engine.default_iterations,
      .e_mode_category = config.engine.e_mode_category,
  };
}

}  // namespace config
}  // namespace lendcore
