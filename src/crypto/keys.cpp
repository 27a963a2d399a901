#include "crypto/keys.h"
#include <algorithm>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <stdexcept>
#include <string>

namespace vaultsim {
namespace crypto {

namespace {
/// Helper to convert OpenSSL errors to string
std::string get_openssl_error() {
  char buffer[256];
  ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
  return std::string(buffer);
}

/// Public key for a seed, or an error description
Result<PublicSignKey> derive_public_key(const Bytes &seed) {
  EVP_PKEY *pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                seed.data(), seed.size());
  if (!pkey) {
    return Result<PublicSignKey>("Failed to load Ed25519 seed: " +
                                 get_openssl_error());
  }

  PublicSignKey key{};
  size_t key_len = key.size();
  if (EVP_PKEY_get_raw_public_key(pkey, key.data(), &key_len) != 1 ||
      key_len != key.size()) {
    EVP_PKEY_free(pkey);
    return Result<PublicSignKey>("Failed to extract public key: " +
                                 get_openssl_error());
  }

  EVP_PKEY_free(pkey);
  return Result<PublicSignKey>(key);
}
} // namespace

XorName sha256(const uint8_t *data, size_t len) {
  XorName hash{};

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("Failed to allocate digest context");
  }

  unsigned int out_len = SHA256_DIGEST_LENGTH;
  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx, data, len) != 1 ||
      EVP_DigestFinal_ex(ctx, hash.data(), &out_len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("SHA256 failed: " + get_openssl_error());
  }

  EVP_MD_CTX_free(ctx);
  return hash;
}

XorName sha256(const Bytes &data) { return sha256(data.data(), data.size()); }

XorName name_from_key(const PublicSignKey &key) {
  return sha256(key.data(), key.size());
}

bool verify(const PublicSignKey &key, const Bytes &message,
            const Signature &signature) {
  if (signature.size() != ED25519_SIGNATURE_SIZE) {
    return false;
  }

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    return false;
  }

  EVP_PKEY *pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               key.data(), key.size());
  if (!pkey) {
    EVP_MD_CTX_free(ctx);
    return false;
  }

  if (EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, pkey) != 1) {
    EVP_PKEY_free(pkey);
    EVP_MD_CTX_free(ctx);
    return false;
  }

  int result = EVP_DigestVerify(ctx, signature.data(), signature.size(),
                                message.data(), message.size());

  EVP_PKEY_free(pkey);
  EVP_MD_CTX_free(ctx);

  return result == 1;
}

PublicKeys::PublicKeys() : sign_key_{}, name_{} {}

PublicKeys::PublicKeys(const PublicSignKey &sign_key)
    : sign_key_(sign_key), name_(name_from_key(sign_key)) {}

SecretKeys SecretKeys::generate(SeededRng &rng) {
  auto keys = from_seed(rng.gen_bytes(ED25519_SEED_SIZE));
  if (keys.is_err()) {
    throw std::runtime_error(keys.error());
  }
  return std::move(keys).value();
}

Result<SecretKeys> SecretKeys::from_seed(const Bytes &seed) {
  if (seed.size() != ED25519_SEED_SIZE) {
    return Result<SecretKeys>("Ed25519 seed must be 32 bytes");
  }

  auto public_key = derive_public_key(seed);
  if (public_key.is_err()) {
    return Result<SecretKeys>(public_key.error());
  }

  return Result<SecretKeys>(SecretKeys(seed, PublicKeys(public_key.value())));
}

Signature SecretKeys::sign(const Bytes &message) const {
  EVP_PKEY *pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                seed_.data(), seed_.size());
  if (!pkey) {
    throw std::runtime_error("Failed to load signing key: " +
                             get_openssl_error());
  }

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    EVP_PKEY_free(pkey);
    throw std::runtime_error("Failed to allocate signing context");
  }

  Signature signature(ED25519_SIGNATURE_SIZE);
  size_t sig_len = signature.size();
  if (EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, pkey) != 1 ||
      EVP_DigestSign(ctx, signature.data(), &sig_len, message.data(),
                     message.size()) != 1) {
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    throw std::runtime_error("Ed25519 signing failed: " + get_openssl_error());
  }

  EVP_MD_CTX_free(ctx);
  EVP_PKEY_free(pkey);

  signature.resize(sig_len);
  return signature;
}

} // namespace crypto
} // namespace vaultsim
