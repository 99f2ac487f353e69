#pragma once

#include <algorithm>
#include <stdexcept>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace common {
namespace math {

inline const Amount kWad{"1000000000000000000"};
inline const Amount kHalfWad{"500000000000000000"};
inline const Amount kRay{"1000000000000000000000000000"};
inline const Amount kHalfRay{"500000000000000000000000000"};
inline const Amount kMaxAmount = ~Amount{0};

inline constexpr BasisPoints kPercentageFactor = 10'000;
inline constexpr BasisPoints kHalfPercentageFactor = 5'000;

// Subtraction that saturates at zero instead of wrapping.
[[nodiscard]] inline Amount zero_floor_sub(const Amount& x, const Amount& y) {
  return x > y ? Amount{x - y} : Amount{0};
}

[[nodiscard]] inline Amount min(const Amount& x, const Amount& y) {
  return std::min(x, y);
}

[[nodiscard]] inline Amount mul_div_down(const Amount& x, const Amount& y, const Amount& denominator) {
  if (denominator == 0) {
    throw std::domain_error("mul_div: division by zero");
  }
  return (x * y) / denominator;
}

[[nodiscard]] inline Amount mul_div_up(const Amount& x, const Amount& y, const Amount& denominator) {
  if (denominator == 0) {
    throw std::domain_error("mul_div: division by zero");
  }
  const Amount product = x * y;
  return product == 0 ? Amount{0} : Amount{(product - 1) / denominator + 1};
}

// RAY (1e27) fixed point. The unsuffixed variants round half up.

[[nodiscard]] inline Amount ray_mul(const Amount& x, const Amount& y) {
  return (x * y + kHalfRay) / kRay;
}

[[nodiscard]] inline Amount ray_mul_down(const Amount& x, const Amount& y) {
  return mul_div_down(x, y, kRay);
}

[[nodiscard]] inline Amount ray_mul_up(const Amount& x, const Amount& y) {
  return mul_div_up(x, y, kRay);
}

[[nodiscard]] inline Amount ray_div(const Amount& x, const Amount& y) {
  if (y == 0) {
    throw std::domain_error("ray_div: division by zero");
  }
  return (x * kRay + y / 2) / y;
}

[[nodiscard]] inline Amount ray_div_down(const Amount& x, const Amount& y) {
  return mul_div_down(x, kRay, y);
}

[[nodiscard]] inline Amount ray_div_up(const Amount& x, const Amount& y) {
  return mul_div_up(x, kRay, y);
}

// WAD (1e18) fixed point, used for health factors.

[[nodiscard]] inline Amount wad_mul(const Amount& x, const Amount& y) {
  return (x * y + kHalfWad) / kWad;
}

[[nodiscard]] inline Amount wad_div(const Amount& x, const Amount& y) {
  if (y == 0) {
    throw std::domain_error("wad_div: division by zero");
  }
  return (x * kWad + y / 2) / y;
}

// Basis points (10'000 == 100%).

[[nodiscard]] inline Amount percent_mul(const Amount& x, BasisPoints percentage) {
  return (x * percentage + kHalfPercentageFactor) / kPercentageFactor;
}

[[nodiscard]] inline Amount percent_mul_down(const Amount& x, BasisPoints percentage) {
  return (x * percentage) / kPercentageFactor;
}

[[nodiscard]] inline Amount percent_div(const Amount& x, BasisPoints percentage) {
  if (percentage == 0) {
    throw std::domain_error("percent_div: division by zero");
  }
  return (x * kPercentageFactor + percentage / 2) / percentage;
}

// x * (1 - percentage) + y * percentage, rounded half up.
[[nodiscard]] inline Amount weighted_avg(const Amount& x, const Amount& y, BasisPoints percentage) {
  const BasisPoints complement = static_cast<BasisPoints>(kPercentageFactor - percentage);
  return (x * complement + y * percentage + kHalfPercentageFactor) / kPercentageFactor;
}

}  // namespace math
}  // namespace common
}  // namespace lendcore
