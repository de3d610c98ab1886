#include "solidcore/custodian/reserve_custodian.hpp"

#include <string>

#include "solidcore/common/error.hpp"

namespace solidcore {
namespace custodian {

ReserveCustodian::ReserveCustodian(common::Address self, common::Address controller,
                                   chain::Runtime& runtime)
    : self_(self), controller_(controller), runtime_(runtime) {}

void ReserveCustodian::deposit(const common::Address& from, common::Amount amount) {
  if (!runtime_.bank().transfer(from, self_, amount)) {
    common::fail(common::ErrorCode::kTransferFailed,
                 "deposit of " + std::to_string(amount) + " from " + from.to_hex());
  }
}

void ReserveCustodian::withdraw(const common::Address& caller, const common::Address& to,
                                common::Amount amount) {
  if (caller != controller_) {
    common::fail(common::ErrorCode::kUnauthorized, caller.to_hex() + " is not the controller");
  }
  const auto reserve = reserve_balance();
  if (amount > reserve) {
    common::fail(common::ErrorCode::kInsufficientReserve,
                 "reserve " + std::to_string(reserve) + " < " + std::to_string(amount));
  }
  // The bank reverts its own accounting when the payment is refused.
  if (!runtime_.bank().transfer(self_, to, amount)) {
    common::fail(common::ErrorCode::kTransferFailed,
                 "payout of " + std::to_string(amount) + " to " + to.to_hex());
  }
}

common::Amount ReserveCustodian::reserve_balance() const {
  return runtime_.bank().balance_of(self_);
}

}  // namespace custodian
}  // namespace solidcore
