#include "solidcore/guard/same_block_guard.hpp"

#include <string>

#include "solidcore/common/error.hpp"

namespace solidcore {
namespace guard {

SameBlockGuard::SameBlockGuard(state::Journal& journal, const common::BlockClock& clock)
    : journal_(journal), clock_(clock) {}

void SameBlockGuard::enforce(const common::Address& account) {
  const auto block = clock_.current();
  std::optional<common::BlockNumber> previous;
  if (auto it = last_block_.find(account); it != last_block_.end()) {
    if (it->second == block) {
      common::fail(common::ErrorCode::kSameBlockReplay,
                   account.to_hex() + " already mutated in block " + std::to_string(block));
    }
    previous = it->second;
    it->second = block;
  } else {
    last_block_.emplace(account, block);
  }

  journal_.record([this, account, previous] {
    if (previous) {
      last_block_[account] = *previous;
    } else {
      last_block_.erase(account);
    }
  });
}

std::optional<common::BlockNumber> SameBlockGuard::last_mutation_block(
    const common::Address& account) const {
  if (auto it = last_block_.find(account); it != last_block_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void SameBlockGuard::save(common::ByteWriter& out) const {
  out.put<std::uint64_t>(last_block_.size());
  for (const auto& [account, block] : last_block_) {
    out.put(account);
    out.put<common::BlockNumber>(block);
  }
}

void SameBlockGuard::load(common::ByteReader& in) {
  last_block_.clear();
  const auto count = in.get<std::uint64_t>();
  for (std::uint64_t i = 0; i < count; ++i) {
    const auto account = in.get_address();
    last_block_[account] = in.get<common::BlockNumber>();
  }
}

}  // namespace guard
}  // namespace solidcore
