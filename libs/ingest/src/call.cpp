#include "solidcore/ingest/call.hpp"

#include <stdexcept>
#include <string>

#include "solidcore/common/byte_codec.hpp"

namespace solidcore {
namespace ingest {

namespace {
constexpr std::size_t kCallSize =
    1 + sizeof(common::BlockNumber) + common::Address::kSize * 3 + sizeof(common::Amount) * 2;
}

std::string_view to_string(CallKind kind) noexcept {
  switch (kind) {
    case CallKind::kTransfer:
      return "transfer";
    case CallKind::kApprove:
      return "approve";
    case CallKind::kTransferFrom:
      return "transfer_from";
    case CallKind::kEnhanceValue:
      return "enhance";
    case CallKind::kRetrieveValue:
      return "retrieve";
    case CallKind::kBuy:
      return "buy";
    case CallKind::kAddLiquidity:
      return "add_liquidity";
    case CallKind::kExtendLiquidityLock:
      return "extend_lock";
    case CallKind::kRemoveLiquidity:
      return "remove_liquidity";
  }
  return "unknown";
}

bool is_valid(std::uint8_t raw_kind) noexcept {
  return raw_kind >= static_cast<std::uint8_t>(CallKind::kTransfer) &&
         raw_kind <= static_cast<std::uint8_t>(CallKind::kRemoveLiquidity);
}

std::vector<std::byte> encode(const Call& call) {
  common::ByteWriter out;
  out.put<std::uint8_t>(static_cast<std::uint8_t>(call.kind));
  out.put<common::BlockNumber>(call.block);
  out.put(call.caller);
  out.put(call.from);
  out.put(call.to);
  out.put<common::Amount>(call.amount);
  out.put<common::Amount>(call.value);
  return out.take();
}

namespace {

Call read_call(common::ByteReader& in) {
  Call call;
  const auto raw_kind = in.get<std::uint8_t>();
  if (!is_valid(raw_kind)) {
    throw std::runtime_error("unknown call kind " + std::to_string(raw_kind));
  }
  call.kind = static_cast<CallKind>(raw_kind);
  call.block = in.get<common::BlockNumber>();
  call.caller = in.get_address();
  call.from = in.get_address();
  call.to = in.get_address();
  call.amount = in.get<common::Amount>();
  call.value = in.get<common::Amount>();
  return call;
}

}  // namespace

Call decode_call(std::span<const std::byte> data) {
  common::ByteReader in(data);
  auto call = read_call(in);
  if (!in.exhausted()) {
    throw std::runtime_error("trailing bytes after call");
  }
  return call;
}

std::vector<std::byte> encode(const SignedCall& signed_call) {
  common::ByteWriter out;
  out.put_bytes(encode(signed_call.call));
  out.put_bytes(std::as_bytes(std::span(signed_call.signature)));
  return out.take();
}

SignedCall decode_signed_call(std::span<const std::byte> data) {
  if (data.size() != kCallSize + auth::kSignatureSize) {
    throw std::runtime_error("signed call must be " +
                             std::to_string(kCallSize + auth::kSignatureSize) + " bytes, got " +
                             std::to_string(data.size()));
  }
  common::ByteReader in(data);
  SignedCall signed_call;
  signed_call.call = read_call(in);
  in.get_bytes(std::as_writable_bytes(std::span(signed_call.signature)));
  return signed_call;
}

SignedCall sign_call(const Call& call, const auth::SecretKey& secret_key) {
  SignedCall signed_call{.call = call, .signature = {}};
  const auto message = encode(call);
  if (!auth::Authenticator::sign(secret_key, message, signed_call.signature)) {
    throw std::runtime_error("failed to sign call");
  }
  return signed_call;
}

}  // namespace ingest
}  // namespace solidcore
