#pragma once

#include "solidcore/common/types.hpp"

namespace solidcore {
namespace swap {

enum class Direction : std::uint8_t {
  kBuy,   // pay currency, receive units
  kSell,  // pay units, receive currency
};

// Constant-product quote against the pool reserves:
//   buy:  value * units    / (currency + value)
//   sell: value * currency / (units    + value)
// Integer division rounds down. Fails with kUndefinedValue when the denominator is zero and
// with kArithmeticOverflow when the reserve sum does not fit an Amount.
[[nodiscard]] common::Amount quote(common::Amount value, Direction direction,
                                   const common::Reserves& reserves);

[[nodiscard]] inline common::Amount quote(common::Amount value, bool is_buy,
                                          const common::Reserves& reserves) {
  return quote(value, is_buy ? Direction::kBuy : Direction::kSell, reserves);
}

}  // namespace swap
}  // namespace solidcore
