// Unit test runner - calls test functions from per-component test files

#include "test_auth.hpp"
#include "test_config.hpp"
#include "test_delta.hpp"
#include "test_events.hpp"
#include "test_interest.hpp"
#include "test_ledger.hpp"
#include "test_matcher.hpp"
#include "test_math.hpp"
#include "test_positions.hpp"
#include "test_ranking.hpp"
#include "test_risk.hpp"

int main() {
  using namespace lendcore::tests;

  // Math tests
  test_zero_floor_sub();
  test_ray_rounding();
  test_percent_math();

  // Delta tests
  test_decrease_delta();
  test_increase_delta();
  test_p2p_totals();
  test_repay_fee();
  test_scaled_conversions();

  // Ranking tests
  test_ranking_order();
  test_ranking_update_remove();
  test_ranking_validation();
  test_ranking_partial_sort();

  // Ledger tests
  test_transaction_commit();
  test_transaction_rollback();
  test_market_sets();

  // Matcher tests
  test_promote_loop_bound();
  test_demote();
  test_matcher_noop();

  // Interest tests
  test_growth_factors();
  test_p2p_index_with_delta();
  test_proportion_idle();

  // Risk tests
  test_liquidity_data();
  test_health_factor();
  test_seize_amounts();

  // Positions tests
  test_supply_to_pool();
  test_full_repay_with_matched_supplier();
  test_delta_round_trip();
  test_idle_supply();
  test_conservation();
  test_full_unwind();
  test_rounding_monotonicity();
  test_liquidation_regimes();
  test_liquidation_execution();
  test_validation_errors();
  test_market_admin();
  test_rollback_on_pool_failure();
  test_flow_events();
  test_repay_into_borrow_delta();
  test_p2p_volume_consistency();

  // Config tests
  test_default_config();
  test_config_values();
  test_config_validation();
  test_config_out_of_range();
  test_config_parse_error();

  // Events and delegation tests
  test_event_sink();
  test_manager_registry();

  return 0;
}
