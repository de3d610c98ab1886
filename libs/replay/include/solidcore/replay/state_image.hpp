#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "solidcore/chain/currency_bank.hpp"
#include "solidcore/common/block_clock.hpp"
#include "solidcore/lock/liquidity_lock.hpp"
#include "solidcore/token/solid_token.hpp"

namespace solidcore {
namespace replay {

// Everything a snapshot must carry to resume: the clock position, native balances, the
// token's ledger and guard state, and the lock's unlock block when a lock is deployed.
struct StateRefs {
  common::ManualBlockClock& clock;
  chain::CurrencyBank& bank;
  token::SolidToken& token;
  lock::LiquidityLock* liquidity_lock{nullptr};
};

std::vector<std::byte> capture(const StateRefs& state);

// Throws std::runtime_error when the image is malformed or was taken with a different lock
// configuration.
void restore(const StateRefs& state, std::span<const std::byte> image);

}  // namespace replay
}  // namespace solidcore
