#pragma once

#include <keyward/schema/primitives.hpp>
#include <keyward/schema/session_key_limits.hpp>
#include <keyward/schema/session_key_state.hpp>
#include <keyward/schema/session_key_usage.hpp>

#include <span>
#include <string_view>

namespace keyward::policy {

/// Action a caller wants to take with a session key.
struct proposed_action_t final {
  keyward::schema::amount_t amount{};
  keyward::schema::address_t contract_address{};
  std::string_view method_name;
};

/// True once `now` is strictly past the configured expiration.
bool is_expired(const keyward::schema::session_key_state_t& state,
                keyward::schema::timestamp_milliseconds_t now);

bool allows_contract(const keyward::schema::session_key_config_t& config,
                     const keyward::schema::address_t& contract);

bool allows_method(const keyward::schema::session_key_config_t& config,
                   std::string_view method);

/// Decide whether `action` may run against `state` at `now`.
///
/// Checks run in a fixed order and the first failure is reported:
/// missing, revoked, inactive, expired, contract, method, per-transaction
/// amount, daily amount, daily count. Daily figures cover the UTC calendar
/// day of `now` and include `in_flight` reservations that have been admitted
/// but not yet settled. Never mutates anything.
keyward::schema::session_key_limits_t evaluate(
    const keyward::schema::session_key_state_t* state,
    const proposed_action_t& action,
    keyward::schema::timestamp_milliseconds_t now,
    std::span<const keyward::schema::session_key_usage_t> in_flight = {});

}  // namespace keyward::policy
