#include "solidcore/lock/liquidity_lock.hpp"

#include <string>

#include "solidcore/common/error.hpp"
#include "solidcore/state/journal.hpp"

namespace solidcore {
namespace lock {

const char* to_string(LockState state) noexcept {
  switch (state) {
    case LockState::kUnset:
      return "unset";
    case LockState::kLocked:
      return "locked";
    case LockState::kUnlockable:
      return "unlockable";
  }
  return "unknown";
}

LiquidityLock::LiquidityLock(common::Address self, common::Address owner, chain::Runtime& runtime)
    : self_(self), owner_(owner), runtime_(runtime) {}

void LiquidityLock::add_liquidity(const common::Address& caller, common::Amount value,
                                  common::BlockNumber unlock_block) {
  guard::ReentrancyGuard::Scope lock(reentrancy_, "add_liquidity");
  state::Transaction tx(runtime_.journal());

  require_owner(caller);
  if (unlock_block_ != 0) {
    common::fail(common::ErrorCode::kAlreadyAdded,
                 "locked until block " + std::to_string(unlock_block_));
  }
  if (value == 0) {
    common::fail(common::ErrorCode::kNoValueSent);
  }
  const auto current = runtime_.current_block();
  if (unlock_block <= current) {
    common::fail(common::ErrorCode::kBlockTooLow,
                 std::to_string(unlock_block) + " is not after block " + std::to_string(current));
  }

  if (!runtime_.bank().transfer(caller, self_, value)) {
    common::fail(common::ErrorCode::kTransferFailed,
                 caller.to_hex() + " cannot fund " + std::to_string(value));
  }
  set_unlock_block(unlock_block);
  runtime_.events().emit(self_, events::LiquidityAddedEvent{
                                    .provider = caller,
                                    .amount = value,
                                    .unlock_block = unlock_block,
                                });

  tx.commit();
}

void LiquidityLock::extend_liquidity_lock(const common::Address& caller,
                                          common::BlockNumber new_unlock_block) {
  guard::ReentrancyGuard::Scope lock(reentrancy_, "extend_liquidity_lock");
  state::Transaction tx(runtime_.journal());

  require_owner(caller);
  if (unlock_block_ == 0) {
    common::fail(common::ErrorCode::kNotAdded);
  }
  if (new_unlock_block <= unlock_block_) {
    common::fail(common::ErrorCode::kCannotShorten,
                 std::to_string(new_unlock_block) + " <= " + std::to_string(unlock_block_));
  }

  set_unlock_block(new_unlock_block);
  runtime_.events().emit(self_, events::LiquidityExtendedEvent{
                                    .provider = caller,
                                    .unlock_block = new_unlock_block,
                                });

  tx.commit();
}

common::Amount LiquidityLock::remove_liquidity(const common::Address& caller) {
  guard::ReentrancyGuard::Scope lock(reentrancy_, "remove_liquidity");
  state::Transaction tx(runtime_.journal());

  require_owner(caller);
  if (unlock_block_ == 0) {
    common::fail(common::ErrorCode::kNotAdded);
  }
  const auto current = runtime_.current_block();
  if (current <= unlock_block_) {
    common::fail(common::ErrorCode::kLocked,
                 "locked until block " + std::to_string(unlock_block_) + ", now " +
                     std::to_string(current));
  }
  const auto amount = locked_balance();
  if (amount == 0) {
    common::fail(common::ErrorCode::kNothingToRemove);
  }

  if (!runtime_.bank().transfer(self_, caller, amount)) {
    common::fail(common::ErrorCode::kTransferFailed,
                 "payout of " + std::to_string(amount) + " to " + caller.to_hex());
  }
  runtime_.events().emit(self_, events::LiquidityRemovedEvent{.recipient = caller, .amount = amount});

  tx.commit();
  return amount;
}

LockState LiquidityLock::state() const noexcept {
  if (unlock_block_ == 0) {
    return LockState::kUnset;
  }
  return runtime_.current_block() > unlock_block_ ? LockState::kUnlockable : LockState::kLocked;
}

common::Amount LiquidityLock::locked_balance() const {
  return runtime_.bank().balance_of(self_);
}

void LiquidityLock::require_owner(const common::Address& caller) const {
  if (caller != owner_) {
    common::fail(common::ErrorCode::kUnauthorized, caller.to_hex() + " does not own the lock");
  }
}

void LiquidityLock::set_unlock_block(common::BlockNumber block) {
  const auto previous = unlock_block_;
  unlock_block_ = block;
  runtime_.journal().record([this, previous] { unlock_block_ = previous; });
}

void LiquidityLock::save(common::ByteWriter& out) const {
  out.put<common::BlockNumber>(unlock_block_);
}

void LiquidityLock::load(common::ByteReader& in) {
  unlock_block_ = in.get<common::BlockNumber>();
}

}  // namespace lock
}  // namespace solidcore
