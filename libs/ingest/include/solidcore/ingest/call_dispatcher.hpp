#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "solidcore/auth/authenticator.hpp"
#include "solidcore/common/block_clock.hpp"
#include "solidcore/common/error.hpp"
#include "solidcore/ingest/call.hpp"
#include "solidcore/lock/liquidity_lock.hpp"
#include "solidcore/telemetry/telemetry_sink.hpp"
#include "solidcore/token/solid_token.hpp"

namespace solidcore {
namespace ingest {

struct CallResult {
  bool accepted{false};
  common::ErrorCode error{common::ErrorCode::kNone};
  std::string message{};
  // Units bought, currency paid out by a sell or retrieval, or liquidity removed.
  common::Amount output{0};
};

// Applies calls, in order, to the token and the optional liquidity lock. The dispatcher owns
// block progression: each call moves the clock to its block, which may not go backwards.
class CallDispatcher {
 public:
  using AcceptedSink = std::function<void(const SignedCall&)>;

  CallDispatcher(const auth::Authenticator& authenticator, token::SolidToken& token,
                 lock::LiquidityLock* liquidity_lock, common::ManualBlockClock& clock,
                 telemetry::TelemetrySink* telemetry = nullptr);

  // Called for every accepted submit(); typically appends to the WAL.
  void set_accepted_sink(AcceptedSink sink);

  // Verifies the caller's signature, then applies the call.
  CallResult submit(const SignedCall& signed_call);

  // Applies an already-verified call (used by replay). Does not reach the accepted sink.
  CallResult apply(const Call& call);

  [[nodiscard]] std::uint64_t accepted_count() const noexcept { return accepted_count_; }
  [[nodiscard]] std::uint64_t rejected_count() const noexcept { return rejected_count_; }

 private:
  const auth::Authenticator& authenticator_;
  token::SolidToken& token_;
  lock::LiquidityLock* lock_;
  common::ManualBlockClock& clock_;
  telemetry::TelemetrySink* telemetry_;
  AcceptedSink accepted_sink_{};
  std::uint64_t accepted_count_{0};
  std::uint64_t rejected_count_{0};

  common::Amount execute(const Call& call);
  CallResult reject(const Call& call, common::ErrorCode code, std::string message);
};

}  // namespace ingest
}  // namespace solidcore
