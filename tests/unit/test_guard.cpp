#include "test_guard.hpp"

#include <cassert>

#include "solidcore/common/block_clock.hpp"
#include "solidcore/guard/reentrancy_guard.hpp"
#include "solidcore/guard/same_block_guard.hpp"
#include "test_support.hpp"

namespace solidcore::tests {

using common::ErrorCode;

void test_same_block_guard() {
  state::Journal journal;
  common::ManualBlockClock clock(5);
  guard::SameBlockGuard guard(journal, clock);
  const auto alice = addr(1);
  const auto bob = addr(2);

  assert(!guard.last_mutation_block(alice).has_value());
  guard.enforce(alice);
  assert(guard.last_mutation_block(alice) == 5);

  expect_error(ErrorCode::kSameBlockReplay, [&] { guard.enforce(alice); });
  guard.enforce(bob);

  clock.advance();
  guard.enforce(alice);
  assert(guard.last_mutation_block(alice) == 6);

  // A stamp made inside a rolled-back transaction is forgotten.
  clock.advance();
  {
    state::Transaction tx(journal);
    guard.enforce(alice);
    assert(guard.last_mutation_block(alice) == 7);
  }
  assert(guard.last_mutation_block(alice) == 6);
  guard.enforce(alice);
}

void test_reentrancy_guard() {
  guard::ReentrancyGuard guard;
  assert(!guard.entered());
  {
    guard::ReentrancyGuard::Scope outer(guard, "outer");
    assert(guard.entered());
    expect_error(ErrorCode::kReentrantCall,
                 [&] { guard::ReentrancyGuard::Scope inner(guard, "inner"); });
    assert(guard.entered());
  }
  assert(!guard.entered());
  guard::ReentrancyGuard::Scope again(guard, "again");
  assert(guard.entered());
}

}  // namespace solidcore::tests
