#include "solidcore/guard/reentrancy_guard.hpp"

#include <string>

#include "solidcore/common/error.hpp"

namespace solidcore {
namespace guard {

ReentrancyGuard::Scope::Scope(ReentrancyGuard& guard, std::string_view operation)
    : guard_(guard) {
  if (guard_.entered_) {
    common::fail(common::ErrorCode::kReentrantCall,
                 std::string(operation) + " called while another operation is in progress");
  }
  guard_.entered_ = true;
}

ReentrancyGuard::Scope::~Scope() {
  guard_.entered_ = false;
}

}  // namespace guard
}  // namespace solidcore
