#pragma once

#include <keyward/schema/execution_request.hpp>
#include <keyward/schema/primitives.hpp>
#include <keyward/schema/signing_identity.hpp>

#include <functional>
#include <string>
#include <variant>

namespace keyward::execution {

struct submission_failure_t final {
  std::string cause;
};

using submission_result_t =
    std::variant<keyward::schema::transaction_reference_t,
                 submission_failure_t>;

/// Signs and broadcasts an admitted request. Called without any engine lock
/// held; may block. Thrown std::exception values are treated as failures.
using transaction_submitter_t = std::function<submission_result_t(
    const keyward::schema::signing_identity_t& identity,
    const keyward::schema::execution_request_t& request)>;

/// Asked before submission when a credential requires user confirmation.
using confirmation_handler_t =
    std::function<bool(const keyward::schema::session_id_t& session_id,
                       const keyward::schema::execution_request_t& request)>;

}  // namespace keyward::execution
