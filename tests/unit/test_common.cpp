#include "test_common.hpp"

#include <cassert>
#include <cstddef>
#include <stdexcept>

#include "solidcore/common/byte_codec.hpp"
#include "solidcore/common/checked_math.hpp"
#include "test_support.hpp"

namespace solidcore::tests {

void test_checked_math() {
  using common::ErrorCode;

  assert(common::checked_add(2, 3) == 5);
  assert(common::checked_sub(5, 3) == 2);
  expect_error(ErrorCode::kArithmeticOverflow, [] { (void)common::checked_add(common::kMaxAmount, 1); });
  expect_error(ErrorCode::kArithmeticOverflow, [] { (void)common::checked_sub(1, 2); });

  assert(common::mul_div(1000, 10, 100) == 100);
  assert(common::mul_div(7, 3, 2) == 10);
  // The product overflows 64 bits, the quotient does not.
  assert(common::mul_div(common::kMaxAmount, common::kMaxAmount, common::kMaxAmount) ==
         common::kMaxAmount);
  expect_error(ErrorCode::kUndefinedValue, [] { (void)common::mul_div(1, 1, 0); });
  expect_error(ErrorCode::kArithmeticOverflow,
               [] { (void)common::mul_div(common::kMaxAmount, 2, 1); });

  const common::LedgerError error(ErrorCode::kInsufficientBalance, "short by 3");
  assert(error.code() == ErrorCode::kInsufficientBalance);
  assert(std::string(error.what()) == "InsufficientBalance: short by 3");
  assert(common::to_string(ErrorCode::kSameBlockReplay) == "SameBlockReplay");
}

void test_address_hex() {
  const auto a = addr(0xab);
  assert(!a.is_null());
  assert(common::kNullAddress.is_null());

  const auto hex = a.to_hex();
  assert(hex.size() == 42);
  assert(hex.starts_with("0xabab"));
  assert(common::Address::from_hex(hex) == a);
  assert(common::Address::from_hex(hex.substr(2)) == a);
  assert(common::Address::from_hex("0xABABABABABABABABABABABABABABABABABABABAB") == a);

  bool rejected = false;
  try {
    (void)common::Address::from_hex("0x1234");
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  assert(rejected);

  rejected = false;
  try {
    (void)common::Address::from_hex("zzababababababababababababababababababab");
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  assert(rejected);
}

void test_byte_codec() {
  common::ByteWriter out;
  out.put<std::uint8_t>(7);
  out.put<std::uint64_t>(1234567890123ull);
  out.put(addr(0x11));

  const auto bytes = out.take();
  assert(bytes.size() == 1 + 8 + common::Address::kSize);
  // Little-endian regardless of host order.
  assert(bytes[1] == std::byte{0xcb});
  assert(bytes[8] == std::byte{0x00});
  common::ByteWriter word;
  word.put<std::uint32_t>(0x01020304u);
  assert(word.bytes()[0] == std::byte{0x04});
  assert(word.bytes()[3] == std::byte{0x01});

  common::ByteReader in(bytes);
  assert(in.get<std::uint8_t>() == 7);
  assert(in.get<std::uint64_t>() == 1234567890123ull);
  assert(in.get_address() == addr(0x11));
  assert(in.exhausted());

  bool threw = false;
  try {
    (void)in.get<std::uint32_t>();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace solidcore::tests
