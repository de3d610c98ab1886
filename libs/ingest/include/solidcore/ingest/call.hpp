#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "solidcore/auth/authenticator.hpp"
#include "solidcore/common/types.hpp"

namespace solidcore {
namespace ingest {

enum class CallKind : std::uint8_t {
  kTransfer = 1,
  kApprove = 2,
  kTransferFrom = 3,
  kEnhanceValue = 4,
  kRetrieveValue = 5,
  kBuy = 6,
  kAddLiquidity = 7,
  kExtendLiquidityLock = 8,
  kRemoveLiquidity = 9,
};

inline constexpr std::size_t kCallKindCount = 10;

[[nodiscard]] std::string_view to_string(CallKind kind) noexcept;
[[nodiscard]] bool is_valid(std::uint8_t raw_kind) noexcept;

// One entry-point invocation. Fields a kind does not use are zero:
//   transfer        to, amount            approve           to (spender), amount
//   transfer_from   from, to, amount      enhance / buy     value
//   retrieve        amount                add_liquidity     value, amount (unlock block)
//   extend_lock     amount (unlock block) remove_liquidity  -
struct Call {
  CallKind kind{CallKind::kTransfer};
  common::BlockNumber block{0};
  common::Address caller{};
  common::Address from{};
  common::Address to{};
  common::Amount amount{0};
  common::Amount value{0};
};

struct SignedCall {
  Call call{};
  auth::Signature signature{};
};

std::vector<std::byte> encode(const Call& call);
Call decode_call(std::span<const std::byte> data);

std::vector<std::byte> encode(const SignedCall& signed_call);
SignedCall decode_signed_call(std::span<const std::byte> data);

// Signs encode(call) with the caller's secret key.
SignedCall sign_call(const Call& call, const auth::SecretKey& secret_key);

}  // namespace ingest
}  // namespace solidcore
