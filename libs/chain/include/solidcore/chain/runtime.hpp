#pragma once

#include "solidcore/chain/currency_bank.hpp"
#include "solidcore/common/block_clock.hpp"
#include "solidcore/events/event_log.hpp"
#include "solidcore/state/journal.hpp"

namespace solidcore {
namespace chain {

// Execution environment shared by every contract: one journal, one currency bank, one event
// log and an injected block source. Entry points run one at a time.
class Runtime {
 public:
  explicit Runtime(const common::BlockClock& clock);
  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  [[nodiscard]] state::Journal& journal() noexcept { return journal_; }
  [[nodiscard]] CurrencyBank& bank() noexcept { return bank_; }
  [[nodiscard]] const CurrencyBank& bank() const noexcept { return bank_; }
  [[nodiscard]] events::EventLog& events() noexcept { return events_; }
  [[nodiscard]] const events::EventLog& events() const noexcept { return events_; }
  [[nodiscard]] const common::BlockClock& clock() const noexcept { return clock_; }
  [[nodiscard]] common::BlockNumber current_block() const noexcept { return clock_.current(); }

 private:
  const common::BlockClock& clock_;
  state::Journal journal_{};
  CurrencyBank bank_;
  events::EventLog events_;
};

}  // namespace chain
}  // namespace solidcore
