#pragma once

#include <unordered_map>

#include "solidcore/common/byte_codec.hpp"
#include "solidcore/common/types.hpp"
#include "solidcore/state/journal.hpp"

namespace solidcore {
namespace chain {

// Programmable recipient of backing currency. on_receive runs after the recipient has been
// credited and may call back into any contract; returning false refuses the payment.
class Recipient {
 public:
  virtual ~Recipient() = default;
  virtual bool on_receive(const common::Address& from, common::Amount amount) = 0;
};

// Native backing-currency balances of every address.
class CurrencyBank {
 public:
  explicit CurrencyBank(state::Journal& journal);

  // Genesis issuance.
  void mint(const common::Address& to, common::Amount amount);

  // Moves currency and runs the recipient hook. Returns false, leaving no effect, when the
  // sender is short or the recipient refuses. Exceptions thrown by the hook propagate after
  // the transfer has been reverted.
  [[nodiscard]] bool transfer(const common::Address& from, const common::Address& to,
                              common::Amount amount);

  [[nodiscard]] common::Amount balance_of(const common::Address& account) const;
  [[nodiscard]] common::Amount total_issued() const noexcept { return total_issued_; }

  void attach_recipient(const common::Address& account, Recipient* recipient);
  void detach_recipient(const common::Address& account);

  void save(common::ByteWriter& out) const;
  void load(common::ByteReader& in);

 private:
  state::Journal& journal_;
  std::unordered_map<common::Address, common::Amount> balances_{};
  std::unordered_map<common::Address, Recipient*> recipients_{};
  common::Amount total_issued_{0};

  void set_balance(const common::Address& account, common::Amount amount);
};

}  // namespace chain
}  // namespace solidcore
