#pragma once

#include <cstdint>

#include "solidcore/chain/runtime.hpp"
#include "solidcore/common/byte_codec.hpp"
#include "solidcore/common/types.hpp"
#include "solidcore/guard/reentrancy_guard.hpp"

namespace solidcore {
namespace lock {

enum class LockState : std::uint8_t {
  kUnset,
  kLocked,
  kUnlockable,
};

[[nodiscard]] const char* to_string(LockState state) noexcept;

// Time-locked deposit of backing currency, independent of the token's custodian. The unlock
// block is set once, can only move later, and the deposit can be withdrawn once the current
// block is past it. All operations are restricted to the owner.
class LiquidityLock {
 public:
  LiquidityLock(common::Address self, common::Address owner, chain::Runtime& runtime);
  LiquidityLock(const LiquidityLock&) = delete;
  LiquidityLock& operator=(const LiquidityLock&) = delete;

  void add_liquidity(const common::Address& caller, common::Amount value,
                     common::BlockNumber unlock_block);
  void extend_liquidity_lock(const common::Address& caller, common::BlockNumber new_unlock_block);
  // Returns the amount paid out.
  common::Amount remove_liquidity(const common::Address& caller);

  [[nodiscard]] LockState state() const noexcept;
  [[nodiscard]] common::BlockNumber unlock_block() const noexcept { return unlock_block_; }
  [[nodiscard]] common::Amount locked_balance() const;
  [[nodiscard]] const common::Address& address() const noexcept { return self_; }
  [[nodiscard]] const common::Address& owner() const noexcept { return owner_; }

  void save(common::ByteWriter& out) const;
  void load(common::ByteReader& in);

 private:
  common::Address self_;
  common::Address owner_;
  chain::Runtime& runtime_;
  guard::ReentrancyGuard reentrancy_{};
  common::BlockNumber unlock_block_{0};  // 0 = unset

  void require_owner(const common::Address& caller) const;
  void set_unlock_block(common::BlockNumber block);
};

}  // namespace lock
}  // namespace solidcore
