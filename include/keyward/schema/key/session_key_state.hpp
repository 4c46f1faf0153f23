#pragma once
#include <keyward/schema/session_key_state.hpp>

namespace keyward::schema::key {

inline constexpr auto kSessionKeyPrefix = std::string_view{"SESSIONKEY|"};

/// `SESSIONKEY|<session id>`
keyward::schema::bytes_t make_key(const keyward::schema::session_id_t& id);
keyward::schema::bytes_t make_key(
    const keyward::schema::session_key_state<1>& value);

/// Prefix covering every persisted session key.
keyward::schema::bytes_t make_session_key_prefix();

}  // namespace keyward::schema::key
