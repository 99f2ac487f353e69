#pragma once

namespace lendcore::tests {

void test_supply_to_pool();
void test_full_repay_with_matched_supplier();
void test_delta_round_trip();
void test_idle_supply();
void test_conservation();
void test_full_unwind();
void test_rounding_monotonicity();
void test_liquidation_regimes();
void test_liquidation_execution();
void test_validation_errors();
void test_market_admin();
void test_rollback_on_pool_failure();
void test_flow_events();
void test_repay_into_borrow_delta();
void test_p2p_volume_consistency();

}  // namespace lendcore::tests
