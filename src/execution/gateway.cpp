#include <keyward/execution/gateway.hpp>
#include <keyward/ledger/usage_ledger.hpp>
#include <keyward/lifecycle/transitions.hpp>
#include <keyward/policy/evaluator.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <mutex>
#include <string>
#include <utility>

using namespace keyward::schema;

namespace keyward::execution {

namespace {

// Caller holds entry.mutex.
void drop_reservation(keyward::registry::session_entry& entry,
                      const std::string_view tag) {
  auto it = std::find_if(
      std::begin(entry.reservations), std::end(entry.reservations),
      [&](const session_key_usage_t& held) { return held.reference == tag; });
  if (it != std::end(entry.reservations)) {
    entry.reservations.erase(it);
  }
}

/// Releases a quota hold on scope exit unless it was settled.
class reservation_guard final {
 public:
  reservation_guard(keyward::registry::session_entry_ptr entry,
                    std::string tag)
      : entry_{std::move(entry)}, tag_{std::move(tag)} {}

  reservation_guard(const reservation_guard&) = delete;
  reservation_guard& operator=(const reservation_guard&) = delete;

  ~reservation_guard() {
    if (!settled_) {
      auto lock = std::scoped_lock{entry_->mutex};
      drop_reservation(*entry_, tag_);
    }
  }

  /// Caller holds the entry lock.
  void settle() {
    drop_reservation(*entry_, tag_);
    settled_ = true;
  }

 private:
  keyward::registry::session_entry_ptr entry_;
  std::string tag_;
  bool settled_{false};
};

void log_denial(const session_id_t& session_id,
                const execution_request_t& request,
                const denial_reason_t reason) {
  switch (category(reason)) {
    case denial_category_t::scope:
      spdlog::error("Session key {} denied {} on {}: {}", to_string(session_id),
                    request.method_name, to_string(request.contract_address),
                    to_string(reason));
      break;
    case denial_category_t::quota:
      spdlog::warn("Session key {} over quota for {} base units: {}",
                   to_string(session_id), request.amount.str(),
                   to_string(reason));
      break;
    case denial_category_t::credential:
      spdlog::warn("Session key {} unusable: {}", to_string(session_id),
                   to_string(reason));
      break;
  }
}

execution_error_t make_error(const execution_error_kind_t kind,
                             std::optional<denial_reason_t> reason = std::nullopt,
                             std::string cause = {}) {
  auto error = execution_error_t{};
  error.kind = kind;
  error.reason = reason;
  error.cause = std::move(cause);
  return error;
}

// Caller holds entry.mutex.
session_key_limits_t evaluate_locked(keyward::registry::registry& registry,
                                     keyward::registry::session_entry& entry,
                                     const keyward::policy::proposed_action_t& action,
                                     const timestamp_milliseconds_t now) {
  auto limits = keyward::policy::evaluate(&entry.state, action, now,
                                          entry.reservations);
  if (limits.limit_reached_reason == denial_reason_t::expired &&
      keyward::lifecycle::expire_if_due(entry.state, now)) {
    registry.persist(entry);
    spdlog::info("Session key {} expired", to_string(entry.state.session_id));
  }
  return limits;
}

}  // namespace

gateway::gateway(keyward::registry::registry& registry,
                 transaction_submitter_t submitter,
                 keyward::common::clock_source_t clock,
                 confirmation_handler_t confirmation_handler)
    : registry_{registry},
      submitter_{std::move(submitter)},
      clock_{std::move(clock)},
      confirmation_handler_{std::move(confirmation_handler)} {}

execution_result_t gateway::execute(const session_id_t& session_id,
                                     const execution_request_t& request) {
  auto current = now();
  auto action = keyward::policy::proposed_action_t{
      request.amount, request.contract_address, request.method_name};

  auto entry = registry_.find(session_id);
  if (!entry) {
    log_denial(session_id, request, denial_reason_t::not_found);
    return make_error(execution_error_kind_t::policy_denied,
                      denial_reason_t::not_found);
  }

  auto tag = std::string{};
  auto identity = signing_identity_t{};
  auto confirmation_required = false;
  {
    auto lock = std::scoped_lock{entry->mutex};
    auto limits = evaluate_locked(registry_, *entry, action, current);
    if (!limits.can_execute_transaction) {
      auto reason = *limits.limit_reached_reason;
      log_denial(session_id, request, reason);
      return make_error(execution_error_kind_t::policy_denied, reason);
    }

    tag = fmt::format("reservation-{}", ++entry->next_reservation);
    auto hold = session_key_usage_t{};
    hold.reference = tag;
    hold.amount = request.amount;
    hold.timestamp = current;
    hold.contract_address = request.contract_address;
    hold.method_name = request.method_name;
    entry->reservations.push_back(std::move(hold));

    identity = entry->state.identity;
    confirmation_required = entry->state.config.require_user_confirmation;
  }
  auto reservation = reservation_guard{entry, tag};

  if (confirmation_required) {
    auto confirmed = false;
    if (confirmation_handler_) {
      confirmed = confirmation_handler_(session_id, request);
    }
    if (!confirmed) {
      spdlog::warn("Session key {} request for {} was not confirmed",
                   to_string(session_id), request.method_name);
      return make_error(execution_error_kind_t::confirmation_declined);
    }
  }

  auto submission = submission_result_t{};
  try {
    submission = submitter_(identity, request);
  } catch (const std::exception& e) {
    submission = submission_failure_t{e.what()};
  }

  return std::visit(
      overloaded{
          [&](const transaction_reference_t& reference) -> execution_result_t {
            auto record = session_key_usage_t{};
            record.reference = reference;
            record.amount = request.amount;
            record.timestamp = current;
            record.contract_address = request.contract_address;
            record.method_name = request.method_name;
            record.gas_limit = request.gas_limit.value_or(0);
            {
              auto lock = std::scoped_lock{entry->mutex};
              reservation.settle();
              keyward::ledger::append(entry->state.usage, record);
              registry_.persist(*entry);
            }
            spdlog::info("Session key {} submitted {} on {}: {}",
                         to_string(session_id), request.method_name,
                         to_string(request.contract_address), reference);

            auto receipt = execution_receipt_t{};
            receipt.session_id = session_id;
            receipt.reference = reference;
            receipt.amount = request.amount;
            receipt.submitted_at = current;
            receipt.contract_address = request.contract_address;
            receipt.method_name = request.method_name;
            return receipt;
          },
          [&](const submission_failure_t& failure) -> execution_result_t {
            spdlog::warn("Session key {} submission failed: {}",
                         to_string(session_id), failure.cause);
            return make_error(execution_error_kind_t::submission_failed,
                              std::nullopt, failure.cause);
          }},
      submission);
}

session_key_limits_t gateway::check_limits(const session_id_t& session_id,
                                           const amount_t& amount,
                                           const address_t& contract,
                                           const std::string_view method) {
  auto action = keyward::policy::proposed_action_t{amount, contract, method};
  auto entry = registry_.find(session_id);
  if (!entry) {
    return keyward::policy::evaluate(nullptr, action, now());
  }
  auto lock = std::scoped_lock{entry->mutex};
  return evaluate_locked(registry_, *entry, action, now());
}

timestamp_milliseconds_t gateway::now() const {
  return clock_ ? clock_() : registry_.now();
}

}  // namespace keyward::execution
