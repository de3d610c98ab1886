#include "test_swap.hpp"

#include <cassert>

#include "solidcore/swap/swap_engine.hpp"
#include "test_support.hpp"

namespace solidcore::tests {

void test_swap_quotes() {
  const common::Reserves reserves{.currency = 1000, .units = 500};

  // 100 * 500 / 1100 and 100 * 1000 / 600, rounded down.
  assert(swap::quote(100, true, reserves) == 45);
  assert(swap::quote(100, false, reserves) == 166);
  assert(swap::quote(100, swap::Direction::kBuy, reserves) == 45);

  assert(swap::quote(0, true, reserves) == 0);
  assert(swap::quote(1, true, reserves) == 0);

  // Empty side of the pool quotes nothing.
  assert(swap::quote(100, true, common::Reserves{.currency = 1000, .units = 0}) == 0);
  assert(swap::quote(100, false, common::Reserves{.currency = 0, .units = 500}) == 0);

  expect_error(common::ErrorCode::kUndefinedValue,
               [] { (void)swap::quote(0, true, common::Reserves{}); });
  expect_error(common::ErrorCode::kArithmeticOverflow, [] {
    (void)swap::quote(2, true, common::Reserves{.currency = common::kMaxAmount, .units = 1});
  });

  // Large reserves go through the 128-bit intermediate.
  const common::Reserves deep{.currency = 1ull << 62, .units = 1ull << 62};
  assert(swap::quote(1ull << 62, true, deep) == (1ull << 61));
}

}  // namespace solidcore::tests
