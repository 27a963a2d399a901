#pragma once

#include "common/rng.h"
#include "common/types.h"
#include <array>
#include <cstdint>
#include <vector>

namespace vaultsim {
namespace crypto {

using namespace vaultsim::common;

// Key size constants
constexpr size_t ED25519_SEED_SIZE = 32;
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

/// Raw Ed25519 public signing key
using PublicSignKey = std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE>;

/// Detached Ed25519 signature
using Signature = std::vector<uint8_t>;

/**
 * Compute SHA256 of data as a network name
 */
XorName sha256(const Bytes &data);

XorName sha256(const uint8_t *data, size_t len);

/**
 * Network-wide address derivation: the name of a client, and of the client
 * manager group responsible for it, is the SHA256 of its signing key.
 */
XorName name_from_key(const PublicSignKey &key);

/**
 * Verify an Ed25519 signature
 * @return true if signature is valid
 */
bool verify(const PublicSignKey &key, const Bytes &message,
            const Signature &signature);

/**
 * Public half of an identity: signing key plus derived name
 */
class PublicKeys {
public:
  PublicKeys();
  explicit PublicKeys(const PublicSignKey &sign_key);

  const PublicSignKey &public_sign_key() const { return sign_key_; }
  const XorName &name() const { return name_; }

  bool operator==(const PublicKeys &other) const {
    return sign_key_ == other.sign_key_;
  }
  bool operator!=(const PublicKeys &other) const { return !(*this == other); }
  bool operator<(const PublicKeys &other) const {
    return sign_key_ < other.sign_key_;
  }

private:
  PublicSignKey sign_key_;
  XorName name_;
};

/**
 * Full identity: Ed25519 key pair kept as its 32 byte seed
 *
 * Keys are derived from seed bytes drawn from a SeededRng, so identities are
 * reproducible across runs with the same seed.
 */
class SecretKeys {
public:
  /**
   * Derive a key pair from seed bytes drawn from `rng`
   * @throws std::runtime_error if the crypto provider rejects the seed
   */
  static SecretKeys generate(SeededRng &rng);

  /**
   * Derive a key pair from an explicit 32 byte seed
   */
  static Result<SecretKeys> from_seed(const Bytes &seed);

  const PublicKeys &public_keys() const { return public_keys_; }

  /**
   * Sign message with this identity
   * @throws std::runtime_error on provider failure
   */
  Signature sign(const Bytes &message) const;

  SecretKeys() = default;

private:
  SecretKeys(Bytes seed, PublicKeys public_keys)
      : seed_(std::move(seed)), public_keys_(public_keys) {}

  Bytes seed_;
  PublicKeys public_keys_;
};

} // namespace crypto
} // namespace vaultsim
