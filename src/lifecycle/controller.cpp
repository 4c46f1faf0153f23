#include <keyward/lifecycle/controller.hpp>

#include <spdlog/spdlog.h>

#include <mutex>

using namespace keyward::schema;

namespace keyward::lifecycle {

controller::controller(keyward::registry::registry& registry)
    : registry_{registry} {}

bool controller::revoke(const session_id_t& session_id,
                        const std::string_view reason) {
  auto entry = registry_.find(session_id);
  if (!entry) {
    spdlog::warn("Cannot revoke unknown session key {}", to_string(session_id));
    return false;
  }
  auto lock = std::scoped_lock{entry->mutex};
  if (!keyward::lifecycle::revoke(entry->state, reason, registry_.now())) {
    spdlog::debug("Session key {} already revoked", to_string(session_id));
    return false;
  }
  registry_.persist(*entry);
  spdlog::info("Revoked session key {}: {}", to_string(session_id), reason);
  return true;
}

bool controller::expire_if_due(const session_id_t& session_id,
                               const timestamp_milliseconds_t now) {
  auto entry = registry_.find(session_id);
  if (!entry) {
    return false;
  }
  auto lock = std::scoped_lock{entry->mutex};
  if (!keyward::lifecycle::expire_if_due(entry->state, now)) {
    return false;
  }
  registry_.persist(*entry);
  spdlog::info("Session key {} expired", to_string(session_id));
  return true;
}

uint64_t controller::cleanup_expired(const timestamp_milliseconds_t now) {
  return registry_.cleanup_expired_at(now);
}

uint64_t controller::emergency_revoke(const principal_t& principal,
                                      const std::string_view reason) {
  auto now = registry_.now();
  auto count = uint64_t{};
  auto skipped = uint64_t{};
  for (const auto& entry : registry_.entries()) {
    auto lock = std::scoped_lock{entry->mutex};
    if (entry->state.principal != principal || entry->state.is_revoked) {
      continue;
    }
    if (!entry->state.config.emergency_revocation) {
      ++skipped;
      continue;
    }
    if (keyward::lifecycle::revoke(entry->state, reason, now)) {
      registry_.persist(*entry);
      ++count;
    }
  }
  spdlog::info("Emergency revocation for {} revoked {} session key(s)",
               to_string(principal), count);
  if (skipped > 0) {
    spdlog::warn("{} session key(s) of {} opted out of emergency revocation",
                 skipped, to_string(principal));
  }
  return count;
}

}  // namespace keyward::lifecycle
