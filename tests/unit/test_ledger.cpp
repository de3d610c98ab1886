#include "test_ledger.hpp"

#include <cassert>

#include "solidcore/ledger/ledger_state.hpp"
#include "test_support.hpp"

namespace solidcore::tests {

using common::ErrorCode;

void test_ledger_update() {
  state::Journal journal;
  ledger::LedgerState ledger(journal);
  const auto alice = addr(1);
  const auto bob = addr(2);

  ledger.mint(alice, 100);
  assert(ledger.balance_of(alice) == 100);
  assert(ledger.total_supply() == 100);

  ledger.update(alice, bob, 30);
  assert(ledger.balance_of(alice) == 70);
  assert(ledger.balance_of(bob) == 30);
  assert(ledger.total_supply() == 100);

  ledger.burn(bob, 10);
  assert(ledger.balance_of(bob) == 20);
  assert(ledger.total_supply() == 90);
  assert(ledger.sum_of_balances() == ledger.total_supply());

  // Rejected moves leave every balance as it was.
  expect_error(ErrorCode::kInsufficientBalance, [&] { ledger.update(bob, alice, 21); });
  assert(ledger.balance_of(bob) == 20);
  assert(ledger.balance_of(alice) == 70);

  expect_error(ErrorCode::kZeroAddress, [&] { ledger.mint(common::kNullAddress, 5); });
  expect_error(ErrorCode::kZeroAddress, [&] { ledger.burn(common::kNullAddress, 5); });
  expect_error(ErrorCode::kArithmeticOverflow, [&] { ledger.mint(bob, common::kMaxAmount); });
  assert(ledger.total_supply() == 90);

  // Self-transfer is a no-op on balances.
  ledger.update(alice, alice, 70);
  assert(ledger.balance_of(alice) == 70);
  assert(ledger.sum_of_balances() == 90);
}

void test_ledger_allowances() {
  state::Journal journal;
  ledger::LedgerState ledger(journal);
  const auto owner = addr(1);
  const auto spender = addr(2);

  assert(ledger.allowance(owner, spender) == 0);
  ledger.approve(owner, spender, 50);
  assert(ledger.allowance(owner, spender) == 50);
  assert(ledger.allowance(spender, owner) == 0);

  ledger.spend_allowance(owner, spender, 20);
  assert(ledger.allowance(owner, spender) == 30);
  expect_error(ErrorCode::kInsufficientAllowance, [&] { ledger.spend_allowance(owner, spender, 31); });
  assert(ledger.allowance(owner, spender) == 30);

  ledger.approve(owner, spender, common::kMaxAmount);
  ledger.spend_allowance(owner, spender, 1'000'000);
  assert(ledger.allowance(owner, spender) == common::kMaxAmount);

  expect_error(ErrorCode::kZeroAddress, [&] { ledger.approve(common::kNullAddress, spender, 1); });
  expect_error(ErrorCode::kZeroAddress, [&] { ledger.approve(owner, common::kNullAddress, 1); });
}

void test_ledger_rollback() {
  state::Journal journal;
  ledger::LedgerState ledger(journal);
  const auto alice = addr(1);
  const auto bob = addr(2);
  ledger.mint(alice, 100);

  {
    state::Transaction tx(journal);
    ledger.update(alice, bob, 40);
    ledger.approve(alice, bob, 7);
    ledger.burn(alice, 10);
  }
  assert(ledger.balance_of(alice) == 100);
  assert(ledger.balance_of(bob) == 0);
  assert(ledger.allowance(alice, bob) == 0);
  assert(ledger.total_supply() == 100);
  assert(ledger.holder_count() == 1);

  common::ByteWriter out;
  ledger.save(out);
  const auto image = out.take();

  state::Journal other_journal;
  ledger::LedgerState restored(other_journal);
  common::ByteReader in(image);
  restored.load(in);
  assert(in.exhausted());
  assert(restored.balance_of(alice) == 100);
  assert(restored.total_supply() == 100);
}

}  // namespace solidcore::tests
