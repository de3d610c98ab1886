#pragma once

#include <optional>
#include <unordered_map>

#include "solidcore/common/block_clock.hpp"
#include "solidcore/common/byte_codec.hpp"
#include "solidcore/common/types.hpp"
#include "solidcore/state/journal.hpp"

namespace solidcore {
namespace guard {

// Remembers the block of each account's last ledger mutation and rejects a second mutation
// attributed to the same account within that block.
class SameBlockGuard {
 public:
  SameBlockGuard(state::Journal& journal, const common::BlockClock& clock);

  // Throws LedgerError(kSameBlockReplay) when `account` already mutated in the current block;
  // otherwise stamps the account with the current block.
  void enforce(const common::Address& account);

  [[nodiscard]] std::optional<common::BlockNumber> last_mutation_block(
      const common::Address& account) const;

  void save(common::ByteWriter& out) const;
  void load(common::ByteReader& in);

 private:
  state::Journal& journal_;
  const common::BlockClock& clock_;
  std::unordered_map<common::Address, common::BlockNumber> last_block_{};
};

}  // namespace guard
}  // namespace solidcore
