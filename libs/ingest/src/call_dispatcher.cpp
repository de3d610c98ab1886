#include "solidcore/ingest/call_dispatcher.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace solidcore {
namespace ingest {

CallDispatcher::CallDispatcher(const auth::Authenticator& authenticator, token::SolidToken& token,
                               lock::LiquidityLock* liquidity_lock,
                               common::ManualBlockClock& clock,
                               telemetry::TelemetrySink* telemetry)
    : authenticator_(authenticator),
      token_(token),
      lock_(liquidity_lock),
      clock_(clock),
      telemetry_(telemetry) {}

void CallDispatcher::set_accepted_sink(AcceptedSink sink) {
  accepted_sink_ = std::move(sink);
}

CallResult CallDispatcher::submit(const SignedCall& signed_call) {
  const auto message = encode(signed_call.call);
  if (!authenticator_.verify(signed_call.call.caller, message, signed_call.signature)) {
    return reject(signed_call.call, common::ErrorCode::kInvalidSignature,
                  "signature does not match " + signed_call.call.caller.to_hex());
  }

  auto result = apply(signed_call.call);
  if (result.accepted && accepted_sink_) {
    accepted_sink_(signed_call);
  }
  return result;
}

CallResult CallDispatcher::apply(const Call& call) {
  if (call.block < clock_.current()) {
    return reject(call, common::ErrorCode::kBlockOutOfOrder,
                  "block " + std::to_string(call.block) + " precedes " +
                      std::to_string(clock_.current()));
  }
  clock_.set(call.block);

  const auto started = std::chrono::steady_clock::now();
  CallResult result;
  try {
    result.output = execute(call);
    result.accepted = true;
  } catch (const common::LedgerError& error) {
    result.error = error.code();
    result.message = error.what();
  }
  const auto latency = std::chrono::steady_clock::now() - started;

  if (telemetry_) {
    telemetry_->record_call(static_cast<std::uint8_t>(call.kind), result.accepted,
                            std::chrono::duration_cast<std::chrono::nanoseconds>(latency));
    if (!result.accepted) {
      telemetry_->record_rejection(static_cast<std::uint16_t>(result.error));
    }
  }
  if (result.accepted) {
    ++accepted_count_;
  } else {
    ++rejected_count_;
  }
  return result;
}

common::Amount CallDispatcher::execute(const Call& call) {
  switch (call.kind) {
    case CallKind::kTransfer:
      if (call.to == token_.address()) {
        return token_.sell(call.caller, call.amount);
      }
      token_.transfer(call.caller, call.to, call.amount);
      return 0;
    case CallKind::kApprove:
      token_.approve(call.caller, call.to, call.amount);
      return 0;
    case CallKind::kTransferFrom:
      token_.transfer_from(call.caller, call.from, call.to, call.amount);
      return 0;
    case CallKind::kEnhanceValue:
      token_.enhance_token_value(call.caller, call.value);
      return 0;
    case CallKind::kRetrieveValue:
      return token_.retrieve_token_value(call.caller, call.amount);
    case CallKind::kBuy:
      return token_.receive(call.caller, call.value);
    case CallKind::kAddLiquidity:
    case CallKind::kExtendLiquidityLock:
    case CallKind::kRemoveLiquidity:
      break;
  }

  if (lock_ == nullptr) {
    common::fail(common::ErrorCode::kNotAdded, "no liquidity lock deployed");
  }
  switch (call.kind) {
    case CallKind::kAddLiquidity:
      lock_->add_liquidity(call.caller, call.value, call.amount);
      return 0;
    case CallKind::kExtendLiquidityLock:
      lock_->extend_liquidity_lock(call.caller, call.amount);
      return 0;
    case CallKind::kRemoveLiquidity:
      return lock_->remove_liquidity(call.caller);
    default:
      return 0;
  }
}

CallResult CallDispatcher::reject(const Call& call, common::ErrorCode code, std::string message) {
  ++rejected_count_;
  if (telemetry_) {
    telemetry_->record_call(static_cast<std::uint8_t>(call.kind), false,
                            std::chrono::nanoseconds{0});
    telemetry_->record_rejection(static_cast<std::uint16_t>(code));
  }
  return CallResult{
      .accepted = false,
      .error = code,
      .message = std::string(common::to_string(code)) + ": " + message,
      .output = 0,
  };
}

}  // namespace ingest
}  // namespace solidcore
