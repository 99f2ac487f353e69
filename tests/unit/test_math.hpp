#pragma once

namespace lendcore::tests {

void test_zero_floor_sub();
void test_ray_rounding();
void test_percent_math();

}  // namespace lendcore::tests
