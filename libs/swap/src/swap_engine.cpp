#include "solidcore/swap/swap_engine.hpp"

#include "solidcore/common/checked_math.hpp"

namespace solidcore {
namespace swap {

common::Amount quote(common::Amount value, Direction direction,
                     const common::Reserves& reserves) {
  if (direction == Direction::kBuy) {
    const auto denominator = common::checked_add(reserves.currency, value);
    return common::mul_div(value, reserves.units, denominator);
  }
  const auto denominator = common::checked_add(reserves.units, value);
  return common::mul_div(value, reserves.currency, denominator);
}

}  // namespace swap
}  // namespace solidcore
