#include "solidcore/common/types.hpp"

#include <stdexcept>

namespace solidcore {
namespace common {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string Address::to_hex() const {
  std::string out;
  out.reserve(2 + kSize * 2);
  out += "0x";
  for (const auto b : bytes) {
    out += kHexDigits[b >> 4];
    out += kHexDigits[b & 0x0f];
  }
  return out;
}

Address Address::from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if (hex.size() != kSize * 2) {
    throw std::invalid_argument("address must be 40 hex digits");
  }

  Address address;
  for (std::size_t i = 0; i < kSize; ++i) {
    const int hi = hex_value(hex[2 * i]);
    const int lo = hex_value(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("address contains a non-hex digit");
    }
    address.bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return address;
}

}  // namespace common
}  // namespace solidcore
