#pragma once

#include <keyward/crypto/signing_key.hpp>
#include <keyward/schema/primitives.hpp>

namespace keyward::crypto {

/// True when the linked OpenSSL build provides the secp256k1 group.
bool available();

bool verify_signature(const keyward::schema::bytes_view_t& message,
                      const compressed_public_key_t& public_key,
                      const compact_signature_t& signature);

}  // namespace keyward::crypto
