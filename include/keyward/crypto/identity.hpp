#pragma once

#include <keyward/crypto/signing_key.hpp>
#include <keyward/schema/signing_identity.hpp>

namespace keyward::crypto {

/// Last 20 bytes of BLAKE3(compressed public key).
keyward::schema::address_t derive_address(
    const compressed_public_key_t& public_key);

/// Default key material provider: a fresh in-memory secp256k1 key.
keyward::schema::signing_identity_t generate_identity();

}  // namespace keyward::crypto
