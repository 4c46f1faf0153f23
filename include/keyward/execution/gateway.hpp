#pragma once

#include <keyward/common/clock.hpp>
#include <keyward/execution/collaborators.hpp>
#include <keyward/registry/registry.hpp>
#include <keyward/schema/execution_error.hpp>
#include <keyward/schema/execution_request.hpp>
#include <keyward/schema/primitives.hpp>
#include <keyward/schema/session_key_limits.hpp>

#include <cstdint>
#include <string_view>

namespace keyward::execution {

/// Quota is charged when the signer accepts a request, whatever later happens
/// on chain. Reverted transactions still count.
inline constexpr bool kQuotaConsumedAtSubmission = true;

/// Runs requests through policy, then the signer, then the usage ledger.
///
/// Evaluation and quota reservation happen atomically under the credential
/// lock; the signer round-trip happens with no lock held. Concurrent requests
/// against one credential can therefore never jointly exceed its limits.
class gateway final {
 public:
  gateway(keyward::registry::registry& registry,
          transaction_submitter_t submitter,
          keyward::common::clock_source_t clock = {},
          confirmation_handler_t confirmation_handler = {});

  keyward::schema::execution_result_t execute(
      const keyward::schema::session_id_t& session_id,
      const keyward::schema::execution_request_t& request);

  /// Evaluation only. Counts in-flight reservations and applies the lazy
  /// expiry transition, but never reserves or records anything.
  keyward::schema::session_key_limits_t check_limits(
      const keyward::schema::session_id_t& session_id,
      const keyward::schema::amount_t& amount,
      const keyward::schema::address_t& contract,
      std::string_view method);

 private:
  keyward::schema::timestamp_milliseconds_t now() const;

  keyward::registry::registry& registry_;
  transaction_submitter_t submitter_;
  keyward::common::clock_source_t clock_;
  confirmation_handler_t confirmation_handler_;
};

}  // namespace keyward::execution
