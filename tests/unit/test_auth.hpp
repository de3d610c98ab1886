#pragma once

namespace solidcore::tests {

void test_authenticator();
void test_address_derivation();

}  // namespace solidcore::tests
