#include "test_custodian.hpp"

#include <cassert>

#include "solidcore/chain/runtime.hpp"
#include "solidcore/custodian/reserve_custodian.hpp"
#include "test_support.hpp"

namespace solidcore::tests {

using common::ErrorCode;

namespace {

class RefusingRecipient final : public chain::Recipient {
 public:
  bool on_receive(const common::Address&, common::Amount) override {
    ++attempts;
    return false;
  }

  int attempts{0};
};

}  // namespace

void test_reserve_custodian() {
  common::ManualBlockClock clock;
  chain::Runtime runtime(clock);
  const auto controller = addr(0xc0);
  const auto alice = addr(1);
  custodian::ReserveCustodian custodian(addr(0xcc), controller, runtime);
  runtime.bank().mint(alice, 500);

  custodian.deposit(alice, 200);
  assert(custodian.reserve_balance() == 200);
  assert(runtime.bank().balance_of(alice) == 300);

  expect_error(ErrorCode::kTransferFailed, [&] { custodian.deposit(alice, 301); });
  assert(custodian.reserve_balance() == 200);

  expect_error(ErrorCode::kUnauthorized, [&] { custodian.withdraw(alice, alice, 10); });
  expect_error(ErrorCode::kInsufficientReserve,
               [&] { custodian.withdraw(controller, alice, 201); });

  custodian.withdraw(controller, alice, 50);
  assert(custodian.reserve_balance() == 150);
  assert(runtime.bank().balance_of(alice) == 350);
  assert(custodian.controller() == controller);

  // A refused payout leaves the reserve and both balances untouched.
  const auto vault = addr(0x77);
  RefusingRecipient vault_hook;
  runtime.bank().attach_recipient(vault, &vault_hook);
  expect_error(ErrorCode::kTransferFailed, [&] { custodian.withdraw(controller, vault, 40); });
  assert(vault_hook.attempts == 1);
  assert(custodian.reserve_balance() == 150);
  assert(runtime.bank().balance_of(addr(0xcc)) == 150);
  assert(runtime.bank().balance_of(vault) == 0);
}

}  // namespace solidcore::tests
