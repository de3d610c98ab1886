#pragma once

#include <string_view>

namespace solidcore {
namespace guard {

// Non-reentrant lock for the mutating entry points of one contract.
class ReentrancyGuard {
 public:
  class Scope {
   public:
    // Throws LedgerError(kReentrantCall) when the guard is already held.
    Scope(ReentrancyGuard& guard, std::string_view operation);
    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;
    ~Scope();

   private:
    ReentrancyGuard& guard_;
  };

  [[nodiscard]] bool entered() const noexcept { return entered_; }

 private:
  bool entered_{false};
};

}  // namespace guard
}  // namespace solidcore
