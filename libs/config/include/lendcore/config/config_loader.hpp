#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/positions/requests.hpp"

namespace lendcore {
namespace config {

struct EngineSection {
  std::size_t max_sorted_users{16};
  positions::Iterations default_iterations{};
  std::uint8_t e_mode_category{0};
};

struct OracleConfig {
  bool liquidation_allowed{true};
  bool borrow_allowed{true};
};

// One listed asset: the pool reserve it maps to and the optimizer market on top.
struct MarketConfig {
  common::AssetId asset{1};
  std::string symbol{"USDC"};
  std::uint8_t decimals{6};
  common::Amount price{100'000'000};  // base currency, 8 decimals
  common::Amount pool_supply_index{"1000000000000000000000000000"};
  common::Amount pool_borrow_index{"1000000000000000000000000000"};
  common::BasisPoints ltv{8'000};
  common::BasisPoints liquidation_threshold{8'500};
  common::BasisPoints liquidation_bonus{10'500};
  common::Amount supply_cap{0};
  common::Amount borrow_cap{0};
  common::Amount seed_liquidity{0};
  common::BasisPoints reserve_factor{1'000};
  common::BasisPoints p2p_index_cursor{3'333};
  std::uint8_t e_mode_category{0};
  bool borrowing_enabled{true};
  bool is_collateral{true};
};

// Scripted operation run by the daemon.
struct ScenarioStep {
  std::string op;
  common::UserId user{common::kNoUser};
  common::UserId on_behalf{common::kNoUser};  // defaults to `user`
  common::UserId borrower{common::kNoUser};
  common::UserId manager{common::kNoUser};
  common::AssetId asset{common::kNoAsset};
  common::AssetId collateral_asset{common::kNoAsset};
  common::Amount amount{0};
  common::Amount price{0};
  common::Amount pool_supply_index{0};
  common::Amount pool_borrow_index{0};
  std::optional<std::size_t> max_loops{};
  bool approved{true};
};

struct EngineConfig {
  EngineSection engine;
  OracleConfig oracle;
  std::vector<MarketConfig> markets;
  std::vector<ScenarioStep> scenario;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

inline constexpr std::string_view kScenarioOps[] = {
    "supply",   "borrow",    "repay",     "withdraw",          "supply_collateral", "withdraw_collateral",
    "liquidate", "set_price", "set_pool_indexes", "approve_manager", "update_indexes",
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

[[nodiscard]] positions::ManagerConfig to_manager_config(const EngineConfig& config);

}  // namespace config
}  // namespace lendcore
