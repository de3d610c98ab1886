#pragma once

#include <cassert>
#include <cstdint>
#include <utility>

#include "solidcore/common/error.hpp"
#include "solidcore/common/types.hpp"

namespace solidcore::tests {

inline common::Address addr(std::uint8_t tag) {
  common::Address address;
  address.bytes.fill(tag);
  return address;
}

// Runs `fn` and asserts it throws a LedgerError carrying `expected`.
template <typename Fn>
void expect_error(common::ErrorCode expected, Fn&& fn) {
  bool thrown = false;
  try {
    std::forward<Fn>(fn)();
  } catch (const common::LedgerError& error) {
    thrown = true;
    assert(error.code() == expected);
  }
  assert(thrown);
  (void)thrown;
}

}  // namespace solidcore::tests
