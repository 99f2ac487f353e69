#include "test_math.hpp"

#include <cassert>
#include <stdexcept>

#include "lendcore/common/errors.hpp"
#include "lendcore/common/math.hpp"

namespace lendcore::tests {

namespace math = common::math;
using common::Amount;

void test_zero_floor_sub() {
  assert(math::zero_floor_sub(10, 3) == 7);
  assert(math::zero_floor_sub(3, 10) == 0);
  assert(math::zero_floor_sub(5, 5) == 0);
  assert(math::min(4, 9) == 4);

  // Values past 64 bits stay exact.
  const Amount big = math::kRay * math::kRay;
  assert(math::zero_floor_sub(big + 1, big) == 1);
}

void test_ray_rounding() {
  const Amount index = math::kRay * 3 / 2;  // 1.5

  assert(math::ray_mul_down(7, index) == 10);
  assert(math::ray_mul_up(7, index) == 11);
  assert(math::ray_mul(7, index) == 11);  // 10.5 rounds half up
  assert(math::ray_div_down(10, index) == 6);
  assert(math::ray_div_up(10, index) == 7);
  assert(math::ray_div(10, index) == 7);

  // Exact results are the same whatever the direction.
  assert(math::ray_mul_down(6, index) == 9);
  assert(math::ray_mul_up(6, index) == 9);
  assert(math::ray_div_up(9, index) == 6);

  assert(math::mul_div_up(0, 5, 3) == 0);
  assert(math::mul_div_up(1, 1, 3) == 1);
  assert(math::mul_div_down(1, 1, 3) == 0);

  bool threw = false;
  try {
    (void)math::mul_div_down(1, 1, 0);
  } catch (const std::domain_error&) {
    threw = true;
  }
  assert(threw);

  assert(math::wad_div(math::kWad, 2 * math::kWad) == math::kHalfWad);
  assert(math::wad_mul(3 * math::kWad, math::kHalfWad) == 3 * math::kHalfWad);
}

void test_percent_math() {
  assert(math::percent_mul(1'000, 5'000) == 500);
  assert(math::percent_mul(3, 5'000) == 2);  // 1.5 rounds half up
  assert(math::percent_mul_down(3, 5'000) == 1);
  assert(math::percent_div(500, 5'000) == 1'000);
  assert(math::weighted_avg(100, 200, 5'000) == 150);
  assert(math::weighted_avg(100, 200, 0) == 100);
  assert(math::weighted_avg(100, 200, 10'000) == 200);

  assert(common::error_category(common::Error::kNone) == common::ErrorCategory::kNone);
  assert(common::error_category(common::Error::kAmountIsZero) == common::ErrorCategory::kValidation);
  assert(common::error_category(common::Error::kBorrowIsPaused) == common::ErrorCategory::kPolicy);
  assert(common::error_category(common::Error::kUnauthorizedLiquidate) == common::ErrorCategory::kAuthorization);
  assert(common::to_string(common::Error::kPermissionDenied) == "permission denied");
}

}  // namespace lendcore::tests
