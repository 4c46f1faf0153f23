#include <keyward/lifecycle/transitions.hpp>
#include <keyward/policy/evaluator.hpp>

#include <string>

using namespace keyward::schema;

namespace keyward::lifecycle {

bool revoke(session_key_state_t& state,
            const std::string_view reason,
            const timestamp_milliseconds_t now) {
  if (state.is_revoked) {
    return false;
  }
  state.is_revoked = true;
  state.is_active = false;
  state.revoked_at = now;
  state.revoked_reason = std::string{reason};
  return true;
}

bool expire_if_due(session_key_state_t& state,
                   const timestamp_milliseconds_t now) {
  if (!state.is_active || state.is_revoked) {
    return false;
  }
  if (!keyward::policy::is_expired(state, now)) {
    return false;
  }
  state.is_active = false;
  return true;
}

}  // namespace keyward::lifecycle
