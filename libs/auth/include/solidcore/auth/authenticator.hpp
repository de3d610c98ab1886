#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <unordered_map>

#include "solidcore/common/types.hpp"

namespace solidcore {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSeedSize = 32;
constexpr std::size_t kSignatureSize = 64;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Seed = std::array<std::uint8_t, kSeedSize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;

struct KeyPair {
  PublicKey public_key{};
  SecretKey secret_key{};
};

// Account address: first 20 bytes of BLAKE2b-256(public key).
[[nodiscard]] common::Address address_of(const PublicKey& public_key);

// Contract address: first 20 bytes of BLAKE2b-256(creator || nonce).
[[nodiscard]] common::Address derive_contract_address(const common::Address& creator,
                                                      std::uint64_t nonce);

// Parses 64 hex digits; throws std::invalid_argument otherwise.
[[nodiscard]] Seed seed_from_hex(std::string_view hex);

class Authenticator {
 public:
  Authenticator();
  ~Authenticator();

  // Registers the key and returns the derived address
  common::Address register_key(const PublicKey& public_key);

  void unregister_account(const common::Address& account);

  bool has_account(const common::Address& account) const;

  // Returns nullptr if not found
  const PublicKey* get_public_key(const common::Address& account) const;

  // Verify a signature against a message using an account's registered key
  bool verify(const common::Address& account,
              std::span<const std::byte> message,
              const Signature& signature) const;

  static bool verify_with_key(const PublicKey& public_key,
                              std::span<const std::byte> message,
                              const Signature& signature);

  static bool sign(const SecretKey& secret_key,
                   std::span<const std::byte> message,
                   Signature& out_signature);

  static KeyPair generate_keypair();

  // Deterministic keypair, used for configured accounts
  static KeyPair keypair_from_seed(const Seed& seed);

  std::size_t account_count() const;

 private:
  std::unordered_map<common::Address, PublicKey> keys_;
};

}  // namespace auth
}  // namespace solidcore
