#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace solidcore {
namespace common {

enum class ErrorCode : std::uint16_t {
  kNone = 0,

  // Ledger
  kInsufficientBalance = 3001,
  kInsufficientAllowance = 3002,
  kZeroAddress = 3003,
  kZeroValueNotAllowed = 3004,
  kUndefinedValue = 3005,
  kArithmeticOverflow = 3006,
  kAlreadyProvisioned = 3007,

  // Guards
  kSameBlockReplay = 3101,
  kReentrantCall = 3102,

  // Swap and custodian
  kSellTooLow = 3201,
  kBuyTooLow = 3202,
  kInsufficientReserve = 3203,
  kUnauthorized = 3204,
  kTransferFailed = 3205,

  // Liquidity lock
  kAlreadyAdded = 3301,
  kNoValueSent = 3302,
  kBlockTooLow = 3303,
  kCannotShorten = 3304,
  kLocked = 3305,
  kNotAdded = 3306,
  kNothingToRemove = 3307,

  // Call ingestion
  kInvalidSignature = 3401,
  kBlockOutOfOrder = 3402,
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

// Every rejected ledger operation surfaces as a LedgerError; state is rolled back by the
// enclosing state::Transaction before the exception leaves the entry point.
class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorCode code, const std::string& detail);

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

[[noreturn]] void fail(ErrorCode code, const std::string& detail = {});

}  // namespace common
}  // namespace solidcore
