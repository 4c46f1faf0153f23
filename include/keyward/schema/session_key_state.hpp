#pragma once
#include <keyward/schema/primitives.hpp>
#include <keyward/schema/session_key_config.hpp>
#include <keyward/schema/session_key_usage.hpp>
#include <keyward/schema/signing_identity.hpp>
#include <optional>
#include <string>
#include <vector>

namespace keyward::schema {

template <uint16_t Version>
struct session_key_state;

template <>
struct session_key_state<1> final {
  uint16_t version{1};
  session_id_t session_id{};
  principal_t principal{};
  signing_identity_t identity;
  session_key_config_t config;
  std::vector<session_key_usage_t> usage;
  bool is_active{true};
  bool is_revoked{false};
  std::optional<timestamp_milliseconds_t> revoked_at;
  std::optional<std::string> revoked_reason;
};

using session_key_state_t = session_key_state<1>;

}  // namespace keyward::schema
