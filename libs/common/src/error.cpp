#include "solidcore/common/error.hpp"

namespace solidcore {
namespace common {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kNone:
      return "None";
    case ErrorCode::kInsufficientBalance:
      return "InsufficientBalance";
    case ErrorCode::kInsufficientAllowance:
      return "InsufficientAllowance";
    case ErrorCode::kZeroAddress:
      return "ZeroAddress";
    case ErrorCode::kZeroValueNotAllowed:
      return "ZeroValueNotAllowed";
    case ErrorCode::kUndefinedValue:
      return "UndefinedValue";
    case ErrorCode::kArithmeticOverflow:
      return "ArithmeticOverflow";
    case ErrorCode::kAlreadyProvisioned:
      return "AlreadyProvisioned";
    case ErrorCode::kSameBlockReplay:
      return "SameBlockReplay";
    case ErrorCode::kReentrantCall:
      return "ReentrantCall";
    case ErrorCode::kSellTooLow:
      return "SellTooLow";
    case ErrorCode::kBuyTooLow:
      return "BuyTooLow";
    case ErrorCode::kInsufficientReserve:
      return "InsufficientReserve";
    case ErrorCode::kUnauthorized:
      return "Unauthorized";
    case ErrorCode::kTransferFailed:
      return "TransferFailed";
    case ErrorCode::kAlreadyAdded:
      return "AlreadyAdded";
    case ErrorCode::kNoValueSent:
      return "NoValueSent";
    case ErrorCode::kBlockTooLow:
      return "BlockTooLow";
    case ErrorCode::kCannotShorten:
      return "CannotShorten";
    case ErrorCode::kLocked:
      return "Locked";
    case ErrorCode::kNotAdded:
      return "NotAdded";
    case ErrorCode::kNothingToRemove:
      return "NothingToRemove";
    case ErrorCode::kInvalidSignature:
      return "InvalidSignature";
    case ErrorCode::kBlockOutOfOrder:
      return "BlockOutOfOrder";
  }
  return "Unknown";
}

namespace {

std::string format_message(ErrorCode code, const std::string& detail) {
  std::string message{to_string(code)};
  if (!detail.empty()) {
    message += ": ";
    message += detail;
  }
  return message;
}

}  // namespace

LedgerError::LedgerError(ErrorCode code, const std::string& detail)
    : std::runtime_error(format_message(code, detail)), code_(code) {}

void fail(ErrorCode code, const std::string& detail) {
  throw LedgerError(code, detail);
}

}  // namespace common
}  // namespace solidcore
