#include "test_auth.hpp"

#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "solidcore/auth/authenticator.hpp"
#include "test_support.hpp"

namespace solidcore::tests {

void test_authenticator() {
  auth::Seed seed{};
  seed.fill(7);
  const auto pair = auth::Authenticator::keypair_from_seed(seed);
  const auto again = auth::Authenticator::keypair_from_seed(seed);
  assert(pair.public_key == again.public_key);

  auth::Authenticator authenticator;
  const auto account = authenticator.register_key(pair.public_key);
  assert(account == auth::address_of(pair.public_key));
  assert(authenticator.has_account(account));
  assert(authenticator.account_count() == 1);
  assert(*authenticator.get_public_key(account) == pair.public_key);

  const std::vector<std::byte> message{std::byte{1}, std::byte{2}, std::byte{3}};
  auth::Signature signature{};
  assert(auth::Authenticator::sign(pair.secret_key, message, signature));
  assert(authenticator.verify(account, message, signature));
  assert(auth::Authenticator::verify_with_key(pair.public_key, message, signature));

  auto tampered = message;
  tampered[0] = std::byte{9};
  assert(!authenticator.verify(account, tampered, signature));

  const auto other = auth::Authenticator::generate_keypair();
  assert(!auth::Authenticator::verify_with_key(other.public_key, message, signature));
  assert(!authenticator.verify(auth::address_of(other.public_key), message, signature));

  authenticator.unregister_account(account);
  assert(!authenticator.has_account(account));
  assert(authenticator.get_public_key(account) == nullptr);
  assert(!authenticator.verify(account, message, signature));
}

void test_address_derivation() {
  const auto creator = addr(1);
  const auto token = auth::derive_contract_address(creator, 0);
  const auto lock = auth::derive_contract_address(creator, 1);
  assert(token == auth::derive_contract_address(creator, 0));
  assert(token != lock);
  assert(token != auth::derive_contract_address(addr(2), 0));
  assert(!token.is_null());

  const auto seed = auth::seed_from_hex(std::string(64, 'a'));
  assert(seed[0] == 0xaa);
  assert(seed[31] == 0xaa);

  bool rejected = false;
  try {
    (void)auth::seed_from_hex("abcd");
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  assert(rejected);
}

}  // namespace solidcore::tests
