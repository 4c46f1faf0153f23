#pragma once

#include <keyward/lifecycle/transitions.hpp>
#include <keyward/registry/registry.hpp>
#include <keyward/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

namespace keyward::lifecycle {

/// Applies revocation and expiry to credentials held by a registry.
/// Every transition is terminal and idempotent.
class controller final {
 public:
  explicit controller(keyward::registry::registry& registry);

  /// Returns false for unknown or already revoked credentials.
  bool revoke(const keyward::schema::session_id_t& session_id,
              std::string_view reason = kDefaultRevocationReason);

  bool expire_if_due(const keyward::schema::session_id_t& session_id,
                     keyward::schema::timestamp_milliseconds_t now);

  uint64_t cleanup_expired(keyward::schema::timestamp_milliseconds_t now);

  /// Revoke every live credential of `principal` that opted into emergency
  /// revocation. Returns the number revoked.
  uint64_t emergency_revoke(const keyward::schema::principal_t& principal,
                            std::string_view reason = kDefaultRevocationReason);

 private:
  keyward::registry::registry& registry_;
};

}  // namespace keyward::lifecycle
