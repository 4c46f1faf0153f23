#include <keyward/ledger/usage_ledger.hpp>
#include <keyward/policy/evaluator.hpp>

#include <algorithm>

using namespace keyward::schema;

namespace keyward::policy {

namespace {

session_key_limits_t deny(const denial_reason_t reason) {
  auto limits = session_key_limits_t{};
  limits.can_execute_transaction = false;
  limits.limit_reached_reason = reason;
  return limits;
}

amount_t saturating_sub(const amount_t& lhs, const amount_t& rhs) {
  return lhs > rhs ? amount_t{lhs - rhs} : amount_t{0};
}

}  // namespace

bool is_expired(const session_key_state_t& state,
                const timestamp_milliseconds_t now) {
  return now > state.config.expiration_time;
}

bool allows_contract(const session_key_config_t& config,
                     const address_t& contract) {
  return std::find(std::begin(config.allowed_contracts),
                   std::end(config.allowed_contracts),
                   contract) != std::end(config.allowed_contracts);
}

bool allows_method(const session_key_config_t& config,
                   const std::string_view method) {
  return std::find(std::begin(config.allowed_methods),
                   std::end(config.allowed_methods),
                   method) != std::end(config.allowed_methods);
}

session_key_limits_t evaluate(const session_key_state_t* state,
                              const proposed_action_t& action,
                              const timestamp_milliseconds_t now,
                              const std::span<const session_key_usage_t> in_flight) {
  if (state == nullptr) {
    return deny(denial_reason_t::not_found);
  }
  if (state->is_revoked) {
    return deny(denial_reason_t::revoked);
  }
  if (!state->is_active) {
    return deny(denial_reason_t::inactive);
  }
  if (is_expired(*state, now)) {
    return deny(denial_reason_t::expired);
  }
  if (!allows_contract(state->config, action.contract_address)) {
    return deny(denial_reason_t::contract_not_allowed);
  }
  if (!allows_method(state->config, action.method_name)) {
    return deny(denial_reason_t::method_not_allowed);
  }

  const auto& config = state->config;
  auto today = keyward::ledger::calendar_day(now);
  auto settled = keyward::ledger::daily_totals(state->usage, today);
  auto pending = keyward::ledger::daily_totals(in_flight, today);

  auto limits = session_key_limits_t{};
  limits.daily_amount_used = settled.amount + pending.amount;
  limits.transaction_count_used = settled.count + pending.count;
  limits.remaining_daily_amount =
      saturating_sub(config.max_daily_amount, limits.daily_amount_used);
  limits.remaining_transaction_count =
      config.max_transaction_count > limits.transaction_count_used
          ? config.max_transaction_count - limits.transaction_count_used
          : 0;

  if (action.amount > config.max_transaction_amount) {
    limits.limit_reached_reason =
        denial_reason_t::per_transaction_limit_exceeded;
    return limits;
  }
  // used + amount > max, written so it cannot wrap at 2^256.
  if (limits.daily_amount_used > config.max_daily_amount ||
      action.amount > config.max_daily_amount - limits.daily_amount_used) {
    limits.limit_reached_reason = denial_reason_t::daily_amount_limit_exceeded;
    return limits;
  }
  if (limits.transaction_count_used >= config.max_transaction_count) {
    limits.limit_reached_reason = denial_reason_t::daily_count_limit_exceeded;
    return limits;
  }

  limits.can_execute_transaction = true;
  return limits;
}

}  // namespace keyward::policy
