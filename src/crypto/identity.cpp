#include <keyward/blake3/hash.hpp>
#include <keyward/crypto/identity.hpp>

#include <algorithm>
#include <utility>

namespace keyward::crypto {

keyward::schema::address_t derive_address(
    const compressed_public_key_t& public_key) {
  auto digest = keyward::blake3::hash(
      std::span<const uint8_t>{public_key.data(), public_key.size()});
  auto address = keyward::schema::address_t{};
  std::copy(digest.end() - address.size(), digest.end(), address.begin());
  return address;
}

keyward::schema::signing_identity_t generate_identity() {
  auto key = signing_key::generate();
  auto identity = keyward::schema::signing_identity_t{};
  identity.address = derive_address(key->public_key());
  identity.capability = std::move(key);
  return identity;
}

}  // namespace keyward::crypto
