#include "solidcore/chain/currency_bank.hpp"

#include <optional>

#include "solidcore/common/checked_math.hpp"

namespace solidcore {
namespace chain {

CurrencyBank::CurrencyBank(state::Journal& journal) : journal_(journal) {}

void CurrencyBank::mint(const common::Address& to, common::Amount amount) {
  const auto issued = common::checked_add(total_issued_, amount);
  set_balance(to, common::checked_add(balance_of(to), amount));
  const auto previous = total_issued_;
  total_issued_ = issued;
  journal_.record([this, previous] { total_issued_ = previous; });
}

bool CurrencyBank::transfer(const common::Address& from, const common::Address& to,
                            common::Amount amount) {
  if (balance_of(from) < amount) {
    return false;
  }

  state::Transaction tx(journal_);
  set_balance(from, balance_of(from) - amount);
  set_balance(to, common::checked_add(balance_of(to), amount));

  if (auto it = recipients_.find(to); it != recipients_.end() && it->second != nullptr) {
    if (!it->second->on_receive(from, amount)) {
      return false;
    }
  }

  tx.commit();
  return true;
}

common::Amount CurrencyBank::balance_of(const common::Address& account) const {
  if (auto it = balances_.find(account); it != balances_.end()) {
    return it->second;
  }
  return 0;
}

void CurrencyBank::attach_recipient(const common::Address& account, Recipient* recipient) {
  recipients_[account] = recipient;
}

void CurrencyBank::detach_recipient(const common::Address& account) {
  recipients_.erase(account);
}

void CurrencyBank::set_balance(const common::Address& account, common::Amount amount) {
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

void CurrencyBank::save(common::ByteWriter& out) const {
  out.put<common::Amount>(total_issued_);
  out.put<std::uint64_t>(balances_.size());
  for (const auto& [account, amount] : balances_) {
    out.put(account);
    out.put<common::Amount>(amount);
  }
}

void CurrencyBank::load(common::ByteReader& in) {
  total_issued_ = in.get<common::Amount>();
  balances_.clear();
  const auto count = in.get<std::uint64_t>();
  for (std::uint64_t i = 0; i < count; ++i) {
    const auto account = in.get_address();
    balances_[account] = in.get<common::Amount>();
  }
}

}  // namespace chain
}  // namespace solidcore
