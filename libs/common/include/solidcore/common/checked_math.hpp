#pragma once

#include <string>

#include "solidcore/common/error.hpp"
#include "solidcore/common/types.hpp"

namespace solidcore {
namespace common {

inline Amount checked_add(Amount lhs, Amount rhs) {
  if (lhs > kMaxAmount - rhs) {
    fail(ErrorCode::kArithmeticOverflow, std::to_string(lhs) + " + " + std::to_string(rhs));
  }
  return lhs + rhs;
}

inline Amount checked_sub(Amount lhs, Amount rhs) {
  if (rhs > lhs) {
    fail(ErrorCode::kArithmeticOverflow, std::to_string(lhs) + " - " + std::to_string(rhs));
  }
  return lhs - rhs;
}

// floor(a * b / denominator) with a 128-bit intermediate product.
inline Amount mul_div(Amount a, Amount b, Amount denominator) {
  if (denominator == 0) {
    fail(ErrorCode::kUndefinedValue, "division by zero");
  }
  const unsigned __int128 product = static_cast<unsigned __int128>(a) * b;
  const unsigned __int128 quotient = product / denominator;
  if (quotient > kMaxAmount) {
    fail(ErrorCode::kArithmeticOverflow, "mul_div result exceeds amount range");
  }
  return static_cast<Amount>(quotient);
}

}  // namespace common
}  // namespace solidcore
