#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "solidcore/common/block_clock.hpp"
#include "solidcore/common/types.hpp"
#include "solidcore/state/journal.hpp"

namespace solidcore {
namespace events {

struct TransferEvent {
  common::Address from{};
  common::Address to{};
  common::Amount amount{0};
};

struct ApprovalEvent {
  common::Address owner{};
  common::Address spender{};
  common::Amount amount{0};
};

struct ValueEnhancedEvent {
  common::Address contributor{};
  common::Amount amount{0};
};

struct ValueRetrievedEvent {
  common::Address retriever{};
  common::Amount amount{0};
};

struct SwapEvent {
  common::Address sender{};
  common::Amount currency_in{0};
  common::Amount units_in{0};
  common::Amount currency_out{0};
  common::Amount units_out{0};
};

struct LiquidityAddedEvent {
  common::Address provider{};
  common::Amount amount{0};
  common::BlockNumber unlock_block{0};
};

struct LiquidityExtendedEvent {
  common::Address provider{};
  common::BlockNumber unlock_block{0};
};

struct LiquidityRemovedEvent {
  common::Address recipient{};
  common::Amount amount{0};
};

using Payload = std::variant<TransferEvent, ApprovalEvent, ValueEnhancedEvent, ValueRetrievedEvent,
                             SwapEvent, LiquidityAddedEvent, LiquidityExtendedEvent,
                             LiquidityRemovedEvent>;

struct Event {
  std::uint64_t sequence{0};
  common::BlockNumber block{0};
  common::Address emitter{};
  Payload payload{};
};

[[nodiscard]] std::string describe(const Event& event);

class EventLog {
 public:
  EventLog(state::Journal& journal, const common::BlockClock& clock);

  void emit(const common::Address& emitter, Payload payload);

  [[nodiscard]] std::vector<Event> since(std::uint64_t sequence = 0) const;
  [[nodiscard]] std::vector<Event> by_emitter(const common::Address& emitter) const;
  [[nodiscard]] std::optional<Event> last() const;
  [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }
  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }

  template <typename T>
  [[nodiscard]] std::vector<T> of_type() const {
    std::vector<T> result;
    for (const auto& event : events_) {
      if (const auto* typed = std::get_if<T>(&event.payload)) {
        result.push_back(*typed);
      }
    }
    return result;
  }

 private:
  state::Journal& journal_;
  const common::BlockClock& clock_;
  std::vector<Event> events_{};
  std::uint64_t next_sequence_{1};
};

}  // namespace events
}  // namespace solidcore
