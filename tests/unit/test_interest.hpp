#pragma once

namespace lendcore::tests {

void test_growth_factors();
void test_p2p_index_with_delta();
void test_proportion_idle();

}  // namespace lendcore::tests
