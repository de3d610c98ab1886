#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>

namespace solidcore {
namespace common {

using Amount = std::uint64_t;
using BlockNumber = std::uint64_t;
using SequenceId = std::uint64_t;

// Infinite approval: an allowance of kMaxAmount is never decremented.
inline constexpr Amount kMaxAmount = std::numeric_limits<Amount>::max();

struct Address {
  static constexpr std::size_t kSize = 20;

  std::array<std::uint8_t, kSize> bytes{};

  [[nodiscard]] bool is_null() const noexcept {
    for (const auto b : bytes) {
      if (b != 0) {
        return false;
      }
    }
    return true;
  }

  [[nodiscard]] std::string to_hex() const;

  // Accepts an optional 0x prefix; throws std::invalid_argument on malformed input.
  static Address from_hex(std::string_view hex);

  friend bool operator==(const Address&, const Address&) = default;
};

inline constexpr Address kNullAddress{};

struct Reserves {
  Amount currency{0};
  Amount units{0};
};

}  // namespace common
}  // namespace solidcore

namespace std {

template <>
struct hash<solidcore::common::Address> {
  std::size_t operator()(const solidcore::common::Address& address) const noexcept {
    // FNV-1a over the raw bytes.
    std::size_t hash = 14695981039346656037ull;
    for (const auto b : address.bytes) {
      hash ^= b;
      hash *= 1099511628211ull;
    }
    return hash;
  }
};

}  // namespace std
