#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "lendcore/auth/manager_registry.hpp"
#include "lendcore/common/errors.hpp"
#include "lendcore/config/config_loader.hpp"
#include "lendcore/events/event_sink.hpp"
#include "lendcore/pool/simulated_pool.hpp"
#include "lendcore/positions/positions_manager.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file | --print-default]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./lendcore.toml or the built-in defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  std::filesystem::path default_paths[] = {
      "./lendcore.toml",
      "/etc/lendcore/lendcore.toml",
      std::filesystem::path{getenv("HOME") ? getenv("HOME") : ""} / ".config/lendcore/lendcore.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

using namespace lendcore;

void report(std::size_t index, const config::ScenarioStep& step, common::Error error) {
  std::cout << "  [" << index << "] " << step.op << " user=" << step.user << " asset=" << step.asset;
  if (error == common::Error::kNone) {
    std::cout << " -> ok";
  } else {
    std::cout << " -> rejected (" << common::to_string(error) << ")";
  }
}

void report_position(const positions::PositionResult& result) {
  if (!result.ok()) {
    return;
  }
  std::cout << " amount=" << result.amount << " pool=" << result.split.pool << " p2p=" << result.split.p2p
            << " delta=" << result.split.delta << " idle=" << result.split.idle << " loops=" << result.loops;
}

void run_step(std::size_t index,
              const config::ScenarioStep& step,
              positions::PositionsManager& manager,
              pool::SimulatedPool& pool,
              pool::StaticPriceOracle& oracle,
              auth::ManagerRegistry& registry) {
  if (step.op == "supply") {
    const auto result = manager.supply({.caller = step.user,
                                        .asset = step.asset,
                                        .amount = step.amount,
                                        .on_behalf = step.on_behalf,
                                        .max_loops = step.max_loops});
    report(index, step, result.error);
    report_position(result);
  } else if (step.op == "borrow") {
    const auto result = manager.borrow({.caller = step.user,
                                        .asset = step.asset,
                                        .amount = step.amount,
                                        .on_behalf = step.on_behalf,
                                        .receiver = step.user,
                                        .max_loops = step.max_loops});
    report(index, step, result.error);
    report_position(result);
  } else if (step.op == "repay") {
    const auto result = manager.repay({.caller = step.user,
                                       .asset = step.asset,
                                       .amount = step.amount,
                                       .on_behalf = step.on_behalf,
                                       .max_loops = step.max_loops});
    report(index, step, result.error);
    report_position(result);
  } else if (step.op == "withdraw") {
    const auto result = manager.withdraw({.caller = step.user,
                                          .asset = step.asset,
                                          .amount = step.amount,
                                          .on_behalf = step.on_behalf,
                                          .receiver = step.user,
                                          .max_loops = step.max_loops});
    report(index, step, result.error);
    report_position(result);
  } else if (step.op == "supply_collateral") {
    const auto result = manager.supply_collateral(
        {.caller = step.user, .asset = step.asset, .amount = step.amount, .on_behalf = step.on_behalf});
    report(index, step, result.error);
  } else if (step.op == "withdraw_collateral") {
    const auto result = manager.withdraw_collateral({.caller = step.user,
                                                     .asset = step.asset,
                                                     .amount = step.amount,
                                                     .on_behalf = step.on_behalf,
                                                     .receiver = step.user});
    report(index, step, result.error);
  } else if (step.op == "liquidate") {
    const auto result = manager.liquidate({.liquidator = step.user,
                                           .borrow_asset = step.asset,
                                           .collateral_asset = step.collateral_asset,
                                           .borrower = step.borrower,
                                           .max_debt_to_cover = step.amount});
    report(index, step, result.error);
    if (result.ok()) {
      std::cout << " repaid=" << result.repaid << " seized=" << result.seized
                << " close_factor_bp=" << result.close_factor;
    }
  } else if (step.op == "set_price") {
    oracle.set_price(step.asset, step.price);
    report(index, step, common::Error::kNone);
  } else if (step.op == "set_pool_indexes") {
    pool.set_indexes(step.asset, {.pool_supply_index = step.pool_supply_index,
                                  .pool_borrow_index = step.pool_borrow_index});
    report(index, step, common::Error::kNone);
  } else if (step.op == "update_indexes") {
    report(index, step, manager.update_indexes(step.asset));
  } else if (step.op == "approve_manager") {
    registry.approve_manager(step.user, step.manager, step.approved);
    report(index, step, common::Error::kNone);
  }
  std::cout << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace lendcore;

  if (argc > 1 && std::string{argv[1]} == "--print-default") {
    std::cout << config::ConfigLoader::generate_default();
    return 0;
  }
  if (argc > 2) {
    print_usage(argv[0]);
    return 1;
  }

  auto config_path = find_config_path(argc, argv);
  config::EngineConfig cfg;

  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      return 1;
    }
    cfg = std::move(result.config);
  }

  std::cout << "Config loaded successfully\n";
  std::cout << "  Markets: " << cfg.markets.size() << "\n";
  std::cout << "  Scenario steps: " << cfg.scenario.size() << "\n";
  std::cout << "  Max sorted users: " << cfg.engine.max_sorted_users << "\n";

  pool::SimulatedPool pool;
  pool::StaticPriceOracle oracle;
  oracle.set_liquidation_allowed(cfg.oracle.liquidation_allowed);
  oracle.set_borrow_allowed(cfg.oracle.borrow_allowed);
  auth::ManagerRegistry registry;
  events::EventSink sink;

  positions::PositionsManager manager{pool, oracle, registry, sink, config::to_manager_config(cfg)};

  for (const auto& market_cfg : cfg.markets) {
    std::cout << "  Configuring market " << market_cfg.asset << " (" << market_cfg.symbol << ")\n";

    pool.list_reserve(market_cfg.asset,
                      {
                          .borrowing_enabled = market_cfg.borrowing_enabled,
                          .e_mode_category = market_cfg.e_mode_category,
                          .supply_cap = market_cfg.supply_cap,
                          .borrow_cap = market_cfg.borrow_cap,
                          .decimals = market_cfg.decimals,
                          .ltv = market_cfg.ltv,
                          .liquidation_threshold = market_cfg.liquidation_threshold,
                          .liquidation_bonus = market_cfg.liquidation_bonus,
                      },
                      {
                          .pool_supply_index = market_cfg.pool_supply_index,
                          .pool_borrow_index = market_cfg.pool_borrow_index,
                      });
    pool.seed_liquidity(market_cfg.asset, market_cfg.seed_liquidity);
    oracle.set_price(market_cfg.asset, market_cfg.price);

    const auto error = manager.create_market(market_cfg.asset, market_cfg.reserve_factor, market_cfg.p2p_index_cursor);
    if (error != common::Error::kNone) {
      std::cerr << "Failed to create market " << market_cfg.asset << ": " << common::to_string(error) << "\n";
      return 1;
    }
    if (market_cfg.is_collateral) {
      manager.set_is_collateral(market_cfg.asset, true);
    }
  }

  std::cout << "Running scenario\n";
  for (std::size_t i = 0; i < cfg.scenario.size(); ++i) {
    try {
      run_step(i, cfg.scenario[i], manager, pool, oracle, registry);
    } catch (const std::exception& e) {
      std::cout << "\n";
      std::cerr << "Step " << i << " (" << cfg.scenario[i].op << ") failed: " << e.what() << "\n";
    }
  }

  std::cout << "Events\n";
  for (const auto& event : sink.drain()) {
    std::cout << "  " << events::format(event) << "\n";
  }

  std::cout << "Markets\n";
  for (const common::AssetId asset : manager.ledger().markets()) {
    const auto* market = manager.market(asset);
    std::cout << "  asset=" << asset << " p2p_supply=" << market->deltas.supply.scaled_p2p_total
              << " p2p_borrow=" << market->deltas.borrow.scaled_p2p_total
              << " supply_delta=" << market->deltas.supply.scaled_delta
              << " borrow_delta=" << market->deltas.borrow.scaled_delta << " idle=" << market->idle_supply
              << " pool_supplied=" << pool.supplied_by_optimizer(asset)
              << " pool_borrowed=" << pool.borrowed_by_optimizer(asset) << "\n";
  }

  return 0;
}
