#pragma once

namespace solidcore::tests {

void test_checked_math();
void test_address_hex();
void test_byte_codec();

}  // namespace solidcore::tests
