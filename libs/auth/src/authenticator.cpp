#include "solidcore/auth/authenticator.hpp"

#include <sodium.h>

#include <algorithm>
#include <stdexcept>

namespace solidcore {
namespace auth {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

// Ensure sodium is initialized before any crypto operations
void ensure_sodium_init() {
  static SodiumInitializer init;
}

common::Address truncate_digest(const std::array<std::uint8_t, crypto_generichash_BYTES>& digest) {
  common::Address address;
  std::copy_n(digest.begin(), common::Address::kSize, address.bytes.begin());
  return address;
}

}  // namespace

common::Address address_of(const PublicKey& public_key) {
  ensure_sodium_init();
  std::array<std::uint8_t, crypto_generichash_BYTES> digest{};
  crypto_generichash(digest.data(), digest.size(), public_key.data(), public_key.size(),
                     nullptr, 0);
  return truncate_digest(digest);
}

common::Address derive_contract_address(const common::Address& creator, std::uint64_t nonce) {
  ensure_sodium_init();
  std::array<std::uint8_t, common::Address::kSize + sizeof(nonce)> preimage{};
  std::copy(creator.bytes.begin(), creator.bytes.end(), preimage.begin());
  for (std::size_t i = 0; i < sizeof(nonce); ++i) {
    preimage[common::Address::kSize + i] = static_cast<std::uint8_t>(nonce >> (8 * i));
  }

  std::array<std::uint8_t, crypto_generichash_BYTES> digest{};
  crypto_generichash(digest.data(), digest.size(), preimage.data(), preimage.size(), nullptr, 0);
  return truncate_digest(digest);
}

Seed seed_from_hex(std::string_view hex) {
  ensure_sodium_init();
  Seed seed{};
  std::size_t decoded = 0;
  const char* end = nullptr;
  if (sodium_hex2bin(seed.data(), seed.size(), hex.data(), hex.size(), nullptr, &decoded,
                     &end) != 0 ||
      decoded != seed.size() || end != hex.data() + hex.size()) {
    throw std::invalid_argument("seed must be 64 hex digits");
  }
  return seed;
}

Authenticator::Authenticator() {
  ensure_sodium_init();
}

Authenticator::~Authenticator() = default;

common::Address Authenticator::register_key(const PublicKey& public_key) {
  const auto account = address_of(public_key);
  keys_[account] = public_key;
  return account;
}

void Authenticator::unregister_account(const common::Address& account) {
  keys_.erase(account);
}

bool Authenticator::has_account(const common::Address& account) const {
  return keys_.find(account) != keys_.end();
}

const PublicKey* Authenticator::get_public_key(const common::Address& account) const {
  auto it = keys_.find(account);
  if (it == keys_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool Authenticator::verify(const common::Address& account,
                           std::span<const std::byte> message,
                           const Signature& signature) const {
  const PublicKey* key = get_public_key(account);
  if (!key) {
    return false;
  }
  return verify_with_key(*key, message, signature);
}

bool Authenticator::verify_with_key(const PublicKey& public_key,
                                    std::span<const std::byte> message,
                                    const Signature& signature) {
  ensure_sodium_init();

  return crypto_sign_verify_detached(
             signature.data(),
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             public_key.data()) == 0;
}

bool Authenticator::sign(const SecretKey& secret_key,
                         std::span<const std::byte> message,
                         Signature& out_signature) {
  ensure_sodium_init();

  return crypto_sign_detached(
             out_signature.data(),
             nullptr,
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             secret_key.data()) == 0;
}

KeyPair Authenticator::generate_keypair() {
  ensure_sodium_init();
  KeyPair pair;
  crypto_sign_keypair(pair.public_key.data(), pair.secret_key.data());
  return pair;
}

KeyPair Authenticator::keypair_from_seed(const Seed& seed) {
  ensure_sodium_init();
  KeyPair pair;
  if (crypto_sign_seed_keypair(pair.public_key.data(), pair.secret_key.data(), seed.data()) != 0) {
    throw std::runtime_error("crypto_sign_seed_keypair failed");
  }
  return pair;
}

std::size_t Authenticator::account_count() const {
  return keys_.size();
}

}  // namespace auth
}  // namespace solidcore
