#pragma once

#include <cstdint>
#include <unordered_map>
#include <utility>

#include "solidcore/common/byte_codec.hpp"
#include "solidcore/common/types.hpp"
#include "solidcore/state/journal.hpp"

namespace solidcore {
namespace ledger {

struct AllowanceKey {
  common::Address owner{};
  common::Address spender{};

  friend bool operator==(const AllowanceKey&, const AllowanceKey&) = default;
};

struct AllowanceKeyHash {
  std::size_t operator()(const AllowanceKey& key) const noexcept {
    const std::hash<common::Address> hasher;
    return hasher(key.owner) * 31 ^ hasher(key.spender);
  }
};

// Unit balances, allowances and total supply. Every balance change goes through update(),
// which keeps total_supply equal to the sum of all balances.
class LedgerState {
 public:
  explicit LedgerState(state::Journal& journal);

  // from == null mints, to == null burns; otherwise a plain move. Fails with
  // kInsufficientBalance, leaving state unchanged, when `from` holds less than `amount`.
  void update(const common::Address& from, const common::Address& to, common::Amount amount);

  void mint(const common::Address& account, common::Amount amount);
  void burn(const common::Address& account, common::Amount amount);

  void approve(const common::Address& owner, const common::Address& spender,
               common::Amount amount);
  // Consumes allowance unless it is infinite (kMaxAmount).
  void spend_allowance(const common::Address& owner, const common::Address& spender,
                       common::Amount amount);

  [[nodiscard]] common::Amount balance_of(const common::Address& account) const;
  [[nodiscard]] common::Amount allowance(const common::Address& owner,
                                         const common::Address& spender) const;
  [[nodiscard]] common::Amount total_supply() const noexcept { return total_supply_; }

  // Sum over every balance entry, computed with a 128-bit accumulator.
  [[nodiscard]] unsigned __int128 sum_of_balances() const noexcept;
  [[nodiscard]] std::size_t holder_count() const noexcept { return balances_.size(); }

  void save(common::ByteWriter& out) const;
  void load(common::ByteReader& in);

 private:
  state::Journal& journal_;
  std::unordered_map<common::Address, common::Amount> balances_{};
  std::unordered_map<AllowanceKey, common::Amount, AllowanceKeyHash> allowances_{};
  common::Amount total_supply_{0};

  void set_balance(const common::Address& account, common::Amount amount);
  void set_allowance(const AllowanceKey& key, common::Amount amount);
  void set_total_supply(common::Amount amount);
};

}  // namespace ledger
}  // namespace solidcore
