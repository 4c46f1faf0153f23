#pragma once

#include <keyward/schema/primitives.hpp>
#include <openssl/evp.h>

#include <array>
#include <memory>

namespace keyward::crypto {

using compressed_public_key_t = std::array<uint8_t, 33>;
using compact_signature_t = std::array<uint8_t, 64>;  // r || s
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

/// secp256k1 key pair held in process memory.
///
/// This is the default signing capability behind a session key. Nothing in
/// the policy engine calls into it; only an external signer does.
class signing_key final {
 public:
  /// Generate a fresh key. Fatal on OpenSSL failure.
  static std::shared_ptr<const signing_key> generate();

  explicit signing_key(evp_pkey_ptr key);
  signing_key(const signing_key&) = delete;
  signing_key& operator=(const signing_key&) = delete;

  compressed_public_key_t public_key() const;

  /// ECDSA over SHA-256 of `message`, returned in compact form.
  compact_signature_t sign(const keyward::schema::bytes_view_t& message) const;

 private:
  evp_pkey_ptr key_;
};

}  // namespace keyward::crypto
