#include "solidcore/chain/runtime.hpp"

namespace solidcore {
namespace chain {

Runtime::Runtime(const common::BlockClock& clock)
    : clock_(clock), bank_(journal_), events_(journal_, clock_) {}

}  // namespace chain
}  // namespace solidcore
