#pragma once

namespace lendcore::tests {

void test_ranking_order();
void test_ranking_update_remove();
void test_ranking_validation();
void test_ranking_partial_sort();

}  // namespace lendcore::tests
