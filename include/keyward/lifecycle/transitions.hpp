#pragma once

#include <keyward/schema/primitives.hpp>
#include <keyward/schema/session_key_state.hpp>

#include <string_view>

namespace keyward::lifecycle {

inline constexpr auto kDefaultRevocationReason = std::string_view{"User revoked"};

/// Move `state` to revoked. Returns false, leaving `state` untouched, when it
/// is already revoked so the first reason and timestamp stick.
bool revoke(keyward::schema::session_key_state_t& state,
            std::string_view reason,
            keyward::schema::timestamp_milliseconds_t now);

/// Deactivate `state` once `now` is past its expiration. Never sets the
/// revoked flag or a reason. Returns true only when this call flipped it.
bool expire_if_due(keyward::schema::session_key_state_t& state,
                   keyward::schema::timestamp_milliseconds_t now);

}  // namespace keyward::lifecycle
