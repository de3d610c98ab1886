#pragma once

#include "solidcore/chain/runtime.hpp"
#include "solidcore/common/types.hpp"

namespace solidcore {
namespace custodian {

// The "Keeper": holds the backing-currency reserve behind the per-unit solid value. Anyone may
// deposit; only the controller fixed at construction may move funds out.
class ReserveCustodian {
 public:
  ReserveCustodian(common::Address self, common::Address controller, chain::Runtime& runtime);
  ReserveCustodian(const ReserveCustodian&) = delete;
  ReserveCustodian& operator=(const ReserveCustodian&) = delete;

  // Unconditional deposit of `amount` currency held by `from`. Fails with kTransferFailed
  // when `from` cannot fund it.
  void deposit(const common::Address& from, common::Amount amount);

  // Fails with kUnauthorized unless `caller` is the controller, kInsufficientReserve when the
  // reserve is too small, kTransferFailed when the payment is refused.
  void withdraw(const common::Address& caller, const common::Address& to, common::Amount amount);

  [[nodiscard]] common::Amount reserve_balance() const;
  [[nodiscard]] const common::Address& address() const noexcept { return self_; }
  [[nodiscard]] const common::Address& controller() const noexcept { return controller_; }

 private:
  common::Address self_;
  common::Address controller_;
  chain::Runtime& runtime_;
};

}  // namespace custodian
}  // namespace solidcore
