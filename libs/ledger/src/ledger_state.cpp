#include "solidcore/ledger/ledger_state.hpp"

#include <optional>
#include <string>

#include "solidcore/common/checked_math.hpp"
#include "solidcore/common/error.hpp"

namespace solidcore {
namespace ledger {

LedgerState::LedgerState(state::Journal& journal) : journal_(journal) {}

void LedgerState::update(const common::Address& from, const common::Address& to,
                         common::Amount amount) {
  // Validate both legs before writing anything.
  common::Amount new_supply = total_supply_;
  if (from.is_null()) {
    new_supply = common::checked_add(new_supply, amount);
  } else {
    const auto balance = balance_of(from);
    if (balance < amount) {
      common::fail(common::ErrorCode::kInsufficientBalance,
                   from.to_hex() + " holds " + std::to_string(balance) + ", needs " +
                       std::to_string(amount));
    }
  }
  if (to.is_null()) {
    new_supply -= amount;
  }

  if (!from.is_null()) {
    set_balance(from, balance_of(from) - amount);
  }
  if (!to.is_null()) {
    // Cannot overflow: the credited balance is bounded by the (checked) total supply.
    set_balance(to, balance_of(to) + amount);
  }
  if (new_supply != total_supply_) {
    set_total_supply(new_supply);
  }
}

void LedgerState::mint(const common::Address& account, common::Amount amount) {
  if (account.is_null()) {
    common::fail(common::ErrorCode::kZeroAddress, "mint to the null address");
  }
  update(common::kNullAddress, account, amount);
}

void LedgerState::burn(const common::Address& account, common::Amount amount) {
  if (account.is_null()) {
    common::fail(common::ErrorCode::kZeroAddress, "burn from the null address");
  }
  update(account, common::kNullAddress, amount);
}

void LedgerState::approve(const common::Address& owner, const common::Address& spender,
                          common::Amount amount) {
  if (owner.is_null()) {
    common::fail(common::ErrorCode::kZeroAddress, "approval from the null address");
  }
  if (spender.is_null()) {
    common::fail(common::ErrorCode::kZeroAddress, "approval for the null address");
  }
  set_allowance({.owner = owner, .spender = spender}, amount);
}

void LedgerState::spend_allowance(const common::Address& owner, const common::Address& spender,
                                  common::Amount amount) {
  const auto current = allowance(owner, spender);
  if (current == common::kMaxAmount) {
    return;
  }
  if (current < amount) {
    common::fail(common::ErrorCode::kInsufficientAllowance,
                 spender.to_hex() + " may spend " + std::to_string(current) + " of " +
                     owner.to_hex() + ", needs " + std::to_string(amount));
  }
  set_allowance({.owner = owner, .spender = spender}, current - amount);
}

common::Amount LedgerState::balance_of(const common::Address& account) const {
  if (auto it = balances_.find(account); it != balances_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount LedgerState::allowance(const common::Address& owner,
                                      const common::Address& spender) const {
  if (auto it = allowances_.find({.owner = owner, .spender = spender}); it != allowances_.end()) {
    return it->second;
  }
  return 0;
}

unsigned __int128 LedgerState::sum_of_balances() const noexcept {
  unsigned __int128 sum = 0;
  for (const auto& [account, amount] : balances_) {
    sum += amount;
  }
  return sum;
}

void LedgerState::set_balance(const common::Address& account, common::Amount amount) {
  std::optional<common::Amount> previous;
  if (auto it = balances_.find(account); it != balances_.end()) {
    previous = it->second;
    it->second = amount;
  } else {
    balances_.emplace(account, amount);
  }
  journal_.record([this, account, previous] {
    if (previous) {
      balances_[account] = *previous;
    } else {
      balances_.erase(account);
    }
  });
}

void LedgerState::set_allowance(const AllowanceKey& key, common::Amount amount) {
  std::optional<common::Amount> previous;
  if (auto it = allowances_.find(key); it != allowances_.end()) {
    previous = it->second;
    it->second = amount;
  } else {
    allowances_.emplace(key, amount);
  }
  journal_.record([this, key, previous] {
    if (previous) {
      allowances_[key] = *previous;
    } else {
      allowances_.erase(key);
    }
  });
}

void LedgerState::set_total_supply(common::Amount amount) {
  const auto previous = total_supply_;
  total_supply_ = amount;
  journal_.record([this, previous] { total_supply_ = previous; });
}

void LedgerState::save(common::ByteWriter& out) const {
  out.put<common::Amount>(total_supply_);
  out.put<std::uint64_t>(balances_.size());
  for (const auto& [account, amount] : balances_) {
    out.put(account);
    out.put<common::Amount>(amount);
  }
  out.put<std::uint64_t>(allowances_.size());
  for (const auto& [key, amount] : allowances_) {
    out.put(key.owner);
    out.put(key.spender);
    out.put<common::Amount>(amount);
  }
}

void LedgerState::load(common::ByteReader& in) {
  total_supply_ = in.get<common::Amount>();
  balances_.clear();
  const auto balance_count = in.get<std::uint64_t>();
  for (std::uint64_t i = 0; i < balance_count; ++i) {
    const auto account = in.get_address();
    balances_[account] = in.get<common::Amount>();
  }
  allowances_.clear();
  const auto allowance_count = in.get<std::uint64_t>();
  for (std::uint64_t i = 0; i < allowance_count; ++i) {
    AllowanceKey key;
    key.owner = in.get_address();
    key.spender = in.get_address();
    allowances_[key] = in.get<common::Amount>();
  }
}

}  // namespace ledger
}  // namespace solidcore
