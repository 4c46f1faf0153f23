#pragma once

#include <keyward/schema/primitives.hpp>
#include <memory>

namespace keyward::crypto {
class signing_key;
}

namespace keyward::schema {

/// Opaque handle to session key material. The policy engine only passes it
/// through to the external signer.
using signing_capability_t = std::shared_ptr<const keyward::crypto::signing_key>;

template <uint16_t Version>
struct signing_identity;

template <>
struct signing_identity<1> final {
  uint16_t version{1};
  address_t address{};
  signing_capability_t capability;
};

using signing_identity_t = signing_identity<1>;

}  // namespace keyward::schema
