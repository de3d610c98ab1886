#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include "solidcore/chain/runtime.hpp"
#include "solidcore/common/byte_codec.hpp"
#include "solidcore/common/types.hpp"
#include "solidcore/custodian/reserve_custodian.hpp"
#include "solidcore/guard/reentrancy_guard.hpp"
#include "solidcore/guard/same_block_guard.hpp"
#include "solidcore/ledger/ledger_state.hpp"

namespace solidcore {
namespace token {

struct TokenMetadata {
  std::string name{"Solid Value"};
  std::string symbol{"SOLID"};
  std::uint8_t decimals{9};
};

struct Allocation {
  common::Address account{};
  common::Amount amount{0};
};

// Reserve-backed unit ledger with a built-in constant-product pool.
//
// Every entry point takes the calling identity explicitly; value-bearing entry points also take
// the currency amount attached to the call, which is moved from the caller into the contract as
// part of the call. Each mutating entry point runs inside one state::Transaction and under the
// contract's reentrancy lock, so a failure (a thrown common::LedgerError) leaves no trace and a
// programmable recipient cannot re-enter while a payout is outstanding.
class SolidToken {
 public:
  SolidToken(TokenMetadata metadata, common::Address self, common::Address deployer,
             chain::Runtime& runtime);
  SolidToken(const SolidToken&) = delete;
  SolidToken& operator=(const SolidToken&) = delete;

  // Initial supply provisioning. Deployer only, once. `value` currency seeds the pool's
  // currency reserve; an allocation to address() seeds the pool's unit reserve.
  void provision(const common::Address& caller, common::Amount value,
                 std::span<const Allocation> allocations);

  // Sending to address() sells the units to the pool.
  bool transfer(const common::Address& caller, const common::Address& to, common::Amount amount);
  bool approve(const common::Address& caller, const common::Address& spender,
               common::Amount amount);
  bool transfer_from(const common::Address& caller, const common::Address& from,
                     const common::Address& to, common::Amount amount);

  // Currency sent with no instruction buys units from the pool. Returns the units bought.
  common::Amount receive(const common::Address& caller, common::Amount value);
  // Returns the currency paid out.
  common::Amount sell(const common::Address& caller, common::Amount amount);

  void enhance_token_value(const common::Address& caller, common::Amount value);
  // Burns `amount` units and pays out their share of the reserve. Returns the payout.
  common::Amount retrieve_token_value(const common::Address& caller, common::Amount amount);

  [[nodiscard]] common::Amount balance_of(const common::Address& account) const;
  [[nodiscard]] common::Amount allowance(const common::Address& owner,
                                         const common::Address& spender) const;
  [[nodiscard]] common::Amount total_supply() const noexcept;
  // Currency held by the custodian on behalf of all holders.
  [[nodiscard]] common::Amount solid_value() const;
  // solid_value() / total_supply(); kUndefinedValue when nothing is in circulation.
  [[nodiscard]] common::Amount unit_value() const;
  [[nodiscard]] common::Reserves get_reserves() const;
  [[nodiscard]] common::Amount get_amount_out(common::Amount value, bool is_buy) const;

  [[nodiscard]] const std::string& name() const noexcept { return metadata_.name; }
  [[nodiscard]] const std::string& symbol() const noexcept { return metadata_.symbol; }
  [[nodiscard]] std::uint8_t decimals() const noexcept { return metadata_.decimals; }

  [[nodiscard]] const common::Address& address() const noexcept { return self_; }
  [[nodiscard]] const common::Address& deployer() const noexcept { return deployer_; }
  [[nodiscard]] bool provisioned() const noexcept { return provisioned_; }
  [[nodiscard]] const custodian::ReserveCustodian& custodian() const noexcept { return *custodian_; }
  [[nodiscard]] const ledger::LedgerState& ledger() const noexcept { return ledger_; }
  [[nodiscard]] const guard::SameBlockGuard& same_block_guard() const noexcept {
    return same_block_;
  }

  void save(common::ByteWriter& out) const;
  void load(common::ByteReader& in);

 private:
  TokenMetadata metadata_;
  common::Address self_;
  common::Address deployer_;
  chain::Runtime& runtime_;
  ledger::LedgerState ledger_;
  guard::SameBlockGuard same_block_;
  guard::ReentrancyGuard reentrancy_{};
  std::unique_ptr<custodian::ReserveCustodian> custodian_;
  bool provisioned_{false};

  // The single choke point for balance mutation: enforces the same-block guard on `caller`,
  // moves the units and emits the transfer event.
  void internal_move(const common::Address& caller, const common::Address& from,
                     const common::Address& to, common::Amount amount);
  void collect(const common::Address& caller, common::Amount value);
  common::Amount sell_locked(const common::Address& caller, common::Amount amount);
  void set_provisioned(bool provisioned);
};

}  // namespace token
}  // namespace solidcore
