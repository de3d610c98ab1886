#include "test_lock.hpp"

#include <cassert>
#include <string>
#include <vector>

#include "solidcore/chain/runtime.hpp"
#include "solidcore/lock/liquidity_lock.hpp"
#include "test_support.hpp"

namespace solidcore::tests {

using common::ErrorCode;

namespace {

// Owner wallet that calls back into the lock while its payout is in flight.
class ReenteringOwner final : public chain::Recipient {
 public:
  ReenteringOwner(lock::LiquidityLock& liquidity_lock, common::Address self)
      : lock_(liquidity_lock), self_(self) {}

  bool on_receive(const common::Address&, common::Amount) override {
    ++payments;
    observed.push_back(attempt([&] { lock_.add_liquidity(self_, 1, 100); }));
    observed.push_back(attempt([&] { lock_.extend_liquidity_lock(self_, 100); }));
    observed.push_back(attempt([&] { (void)lock_.remove_liquidity(self_); }));
    return true;
  }

  int payments{0};
  std::vector<ErrorCode> observed{};

 private:
  lock::LiquidityLock& lock_;
  common::Address self_;

  template <typename Fn>
  static ErrorCode attempt(Fn&& fn) {
    try {
      fn();
    } catch (const common::LedgerError& error) {
      return error.code();
    }
    return ErrorCode::kNone;
  }
};

}  // namespace

void test_liquidity_lock_lifecycle() {
  common::ManualBlockClock clock(10);
  chain::Runtime runtime(clock);
  const auto owner = addr(1);
  lock::LiquidityLock liquidity_lock(addr(0xb0), owner, runtime);
  runtime.bank().mint(owner, 1000);

  assert(liquidity_lock.state() == lock::LockState::kUnset);
  liquidity_lock.add_liquidity(owner, 600, 20);
  assert(liquidity_lock.state() == lock::LockState::kLocked);
  assert(liquidity_lock.unlock_block() == 20);
  assert(liquidity_lock.locked_balance() == 600);
  assert(runtime.bank().balance_of(owner) == 400);

  expect_error(ErrorCode::kAlreadyAdded, [&] { liquidity_lock.add_liquidity(owner, 100, 30); });
  expect_error(ErrorCode::kCannotShorten, [&] { liquidity_lock.extend_liquidity_lock(owner, 20); });
  expect_error(ErrorCode::kCannotShorten, [&] { liquidity_lock.extend_liquidity_lock(owner, 15); });
  liquidity_lock.extend_liquidity_lock(owner, 25);
  assert(liquidity_lock.unlock_block() == 25);

  // Still locked at the unlock block itself.
  clock.set(25);
  assert(liquidity_lock.state() == lock::LockState::kLocked);
  expect_error(ErrorCode::kLocked, [&] { (void)liquidity_lock.remove_liquidity(owner); });

  clock.set(26);
  assert(liquidity_lock.state() == lock::LockState::kUnlockable);
  assert(liquidity_lock.remove_liquidity(owner) == 600);
  assert(liquidity_lock.locked_balance() == 0);
  assert(runtime.bank().balance_of(owner) == 1000);
  expect_error(ErrorCode::kNothingToRemove, [&] { (void)liquidity_lock.remove_liquidity(owner); });

  assert(runtime.events().of_type<events::LiquidityAddedEvent>().size() == 1);
  assert(runtime.events().of_type<events::LiquidityExtendedEvent>().size() == 1);
  const auto removed = runtime.events().of_type<events::LiquidityRemovedEvent>();
  assert(removed.size() == 1);
  assert(removed[0].amount == 600);
  assert(std::string(lock::to_string(lock::LockState::kUnlockable)) == "unlockable");
}

void test_liquidity_lock_reentrancy() {
  common::ManualBlockClock clock(10);
  chain::Runtime runtime(clock);
  const auto owner = addr(1);
  lock::LiquidityLock liquidity_lock(addr(0xb0), owner, runtime);
  ReenteringOwner wallet(liquidity_lock, owner);
  runtime.bank().mint(owner, 1000);

  liquidity_lock.add_liquidity(owner, 400, 20);
  runtime.bank().attach_recipient(owner, &wallet);

  clock.set(21);
  assert(liquidity_lock.remove_liquidity(owner) == 400);
  assert(wallet.payments == 1);
  assert(wallet.observed.size() == 3);
  for (const auto code : wallet.observed) {
    assert(code == ErrorCode::kReentrantCall);
  }
  assert(liquidity_lock.unlock_block() == 20);
  assert(liquidity_lock.locked_balance() == 0);
  assert(runtime.bank().balance_of(owner) == 1000);
  assert(runtime.events().of_type<events::LiquidityRemovedEvent>().size() == 1);
  assert(runtime.events().of_type<events::LiquidityExtendedEvent>().empty());
}

void test_liquidity_lock_rejections() {
  common::ManualBlockClock clock(10);
  chain::Runtime runtime(clock);
  const auto owner = addr(1);
  const auto stranger = addr(2);
  lock::LiquidityLock liquidity_lock(addr(0xb0), owner, runtime);
  runtime.bank().mint(owner, 1000);
  runtime.bank().mint(stranger, 1000);

  expect_error(ErrorCode::kUnauthorized, [&] { liquidity_lock.add_liquidity(stranger, 100, 20); });
  expect_error(ErrorCode::kNoValueSent, [&] { liquidity_lock.add_liquidity(owner, 0, 20); });
  expect_error(ErrorCode::kBlockTooLow, [&] { liquidity_lock.add_liquidity(owner, 100, 10); });
  expect_error(ErrorCode::kNotAdded, [&] { liquidity_lock.extend_liquidity_lock(owner, 30); });
  expect_error(ErrorCode::kNotAdded, [&] { (void)liquidity_lock.remove_liquidity(owner); });
  expect_error(ErrorCode::kTransferFailed, [&] { liquidity_lock.add_liquidity(owner, 5000, 20); });
  assert(liquidity_lock.state() == lock::LockState::kUnset);
  assert(liquidity_lock.unlock_block() == 0);
  assert(runtime.events().size() == 0);

  liquidity_lock.add_liquidity(owner, 100, 20);
  expect_error(ErrorCode::kUnauthorized,
               [&] { liquidity_lock.extend_liquidity_lock(stranger, 30); });
  clock.set(30);
  expect_error(ErrorCode::kUnauthorized, [&] { (void)liquidity_lock.remove_liquidity(stranger); });
  assert(liquidity_lock.locked_balance() == 100);

  common::ByteWriter out;
  liquidity_lock.save(out);
  lock::LiquidityLock restored(addr(0xb0), owner, runtime);
  const auto image = out.take();
  common::ByteReader in(image);
  restored.load(in);
  assert(restored.unlock_block() == 20);
  assert(restored.state() == lock::LockState::kUnlockable);
}

}  // namespace solidcore::tests
