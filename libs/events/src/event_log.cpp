#include "solidcore/events/event_log.hpp"

#include <sstream>
#include <type_traits>
#include <utility>

namespace solidcore {
namespace events {

std::string describe(const Event& event) {
  std::ostringstream out;
  out << "#" << event.sequence << " @" << event.block << " ";
  std::visit(
      [&out](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, TransferEvent>) {
          out << "Transfer " << payload.from.to_hex() << " -> " << payload.to.to_hex() << " "
              << payload.amount;
        } else if constexpr (std::is_same_v<T, ApprovalEvent>) {
          out << "Approval " << payload.owner.to_hex() << " -> " << payload.spender.to_hex()
              << " " << payload.amount;
        } else if constexpr (std::is_same_v<T, ValueEnhancedEvent>) {
          out << "ValueEnhanced " << payload.contributor.to_hex() << " " << payload.amount;
        } else if constexpr (std::is_same_v<T, ValueRetrievedEvent>) {
          out << "ValueRetrieved " << payload.retriever.to_hex() << " " << payload.amount;
        } else if constexpr (std::is_same_v<T, SwapEvent>) {
          out << "Swap " << payload.sender.to_hex() << " in(" << payload.currency_in << ", "
              << payload.units_in << ") out(" << payload.currency_out << ", "
              << payload.units_out << ")";
        } else if constexpr (std::is_same_v<T, LiquidityAddedEvent>) {
          out << "LiquidityAdded " << payload.provider.to_hex() << " " << payload.amount
              << " until " << payload.unlock_block;
        } else if constexpr (std::is_same_v<T, LiquidityExtendedEvent>) {
          out << "LiquidityExtended " << payload.provider.to_hex() << " until "
              << payload.unlock_block;
        } else if constexpr (std::is_same_v<T, LiquidityRemovedEvent>) {
          out << "LiquidityRemoved " << payload.recipient.to_hex() << " " << payload.amount;
        }
      },
      event.payload);
  return out.str();
}

EventLog::EventLog(state::Journal& journal, const common::BlockClock& clock)
    : journal_(journal), clock_(clock) {}

void EventLog::emit(const common::Address& emitter, Payload payload) {
  events_.push_back(Event{
      .sequence = next_sequence_++,
      .block = clock_.current(),
      .emitter = emitter,
      .payload = std::move(payload),
  });
  journal_.record([this] {
    events_.pop_back();
    --next_sequence_;
  });
}

std::vector<Event> EventLog::since(std::uint64_t sequence) const {
  std::vector<Event> result;
  for (const auto& event : events_) {
    if (event.sequence >= sequence) {
      result.push_back(event);
    }
  }
  return result;
}

std::vector<Event> EventLog::by_emitter(const common::Address& emitter) const {
  std::vector<Event> result;
  for (const auto& event : events_) {
    if (event.emitter == emitter) {
      result.push_back(event);
    }
  }
  return result;
}

std::optional<Event> EventLog::last() const {
  if (events_.empty()) {
    return std::nullopt;
  }
  return events_.back();
}

}  // namespace events
}  // namespace solidcore
