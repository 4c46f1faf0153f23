#include <gtest/gtest.h>
#include <keyward/execution/gateway.hpp>
#include <keyward/lifecycle/controller.hpp>
#include <keyward/testing/common.hpp>

#include <stdexcept>
#include <variant>

using namespace keyward::schema;
using keyward::testing::kHour;
using keyward::testing::make_address;
using keyward::testing::make_config;
using keyward::testing::make_request;

namespace {

struct gateway_fixture : ::testing::Test {
  keyward::testing::manual_clock clock;
  keyward::testing::counting_submitter submitter;
  keyward::registry::registry registry{clock.source(),
                                       keyward::testing::make_fake_key_provider()};
  keyward::execution::gateway gateway{registry, submitter.submitter(),
                                      clock.source()};
  principal_t alice = make_address(0x10);

  session_id_t create(const uint64_t per_tx,
                      const uint64_t daily,
                      const uint32_t count) {
    return std::get<session_id_t>(
        registry.create(alice, make_config(clock.now->load(), per_tx, daily, count)));
  }

  size_t usage_count(const session_id_t& id) {
    return registry.get(id).value().usage.size();
  }
};

std::optional<denial_reason_t> denial_of(const execution_result_t& result) {
  if (!std::holds_alternative<execution_error_t>(result)) {
    return std::nullopt;
  }
  return std::get<execution_error_t>(result).reason;
}

}  // namespace

TEST(execution_gateway, quota_is_charged_at_submission) {
  EXPECT_TRUE(keyward::execution::kQuotaConsumedAtSubmission);
}

TEST_F(gateway_fixture, successful_execution_records_usage) {
  auto id = create(100, 250, 3);
  auto request = make_request(60);
  request.gas_limit = 21'000;

  auto result = gateway.execute(id, request);
  ASSERT_TRUE(std::holds_alternative<execution_receipt_t>(result));
  const auto& receipt = std::get<execution_receipt_t>(result);
  EXPECT_EQ(receipt.session_id, id);
  EXPECT_EQ(receipt.reference, "0xtx1");
  EXPECT_EQ(receipt.amount, amount_t{60});
  EXPECT_EQ(receipt.submitted_at, clock.now->load());
  EXPECT_EQ(receipt.method_name, "transfer");

  auto state = registry.get(id);
  ASSERT_TRUE(state.has_value());
  ASSERT_EQ(state->usage.size(), 1u);
  EXPECT_EQ(state->usage[0].reference, "0xtx1");
  EXPECT_EQ(state->usage[0].gas_limit, 21'000u);
  EXPECT_EQ(state->usage[0].contract_address, make_address(1));
}

TEST_F(gateway_fixture, third_transfer_exceeds_daily_amount) {
  auto id = create(100, 250, 3);
  ASSERT_TRUE(std::holds_alternative<execution_receipt_t>(
      gateway.execute(id, make_request(100))));
  ASSERT_TRUE(std::holds_alternative<execution_receipt_t>(
      gateway.execute(id, make_request(100))));

  auto result = gateway.execute(id, make_request(100));
  EXPECT_EQ(denial_of(result), denial_reason_t::daily_amount_limit_exceeded);
  EXPECT_EQ(std::get<execution_error_t>(result).kind,
            execution_error_kind_t::policy_denied);
  EXPECT_EQ(usage_count(id), 2u);
  EXPECT_EQ(submitter.calls->load(), 2u);
}

TEST_F(gateway_fixture, exhausted_count_denies_tiny_amount) {
  auto id = create(100, 1'000, 3);
  for (auto i = 0; i < 3; ++i) {
    ASSERT_TRUE(std::holds_alternative<execution_receipt_t>(
        gateway.execute(id, make_request(10))));
  }
  EXPECT_EQ(denial_of(gateway.execute(id, make_request(1))),
            denial_reason_t::daily_count_limit_exceeded);
}

TEST_F(gateway_fixture, quota_resets_at_next_calendar_day) {
  auto today = clock.now->load() / kMillisecondsPerDay;
  clock.set((today + 1) * kMillisecondsPerDay - 1);
  // Keep the credential alive across midnight.
  auto config = make_config(clock.now->load(), 100, 100, 1);
  config.expiration_time = clock.now->load() + kHour;
  auto late = std::get<session_id_t>(registry.create(alice, config));

  ASSERT_TRUE(std::holds_alternative<execution_receipt_t>(
      gateway.execute(late, make_request(100))));
  EXPECT_EQ(denial_of(gateway.execute(late, make_request(1))),
            denial_reason_t::daily_amount_limit_exceeded);

  clock.advance(1);
  EXPECT_TRUE(std::holds_alternative<execution_receipt_t>(
      gateway.execute(late, make_request(100))));
}

TEST_F(gateway_fixture, denials_never_reach_the_signer) {
  auto id = create(100, 250, 3);
  EXPECT_EQ(denial_of(gateway.execute(id, make_request(101))),
            denial_reason_t::per_transaction_limit_exceeded);
  EXPECT_EQ(denial_of(gateway.execute(id, make_request(1, "withdraw"))),
            denial_reason_t::method_not_allowed);
  auto request = make_request(1);
  request.contract_address = make_address(50);
  EXPECT_EQ(denial_of(gateway.execute(id, request)),
            denial_reason_t::contract_not_allowed);
  EXPECT_EQ(denial_of(gateway.execute(keyward::testing::make_hash(7),
                                      make_request(1))),
            denial_reason_t::not_found);
  EXPECT_EQ(submitter.calls->load(), 0u);
  EXPECT_EQ(usage_count(id), 0u);
}

TEST_F(gateway_fixture, revoked_credential_is_denied_forever) {
  auto id = create(100, 250, 3);
  auto lifecycle = keyward::lifecycle::controller{registry};
  ASSERT_TRUE(lifecycle.revoke(id));
  for (auto i = 0; i < 3; ++i) {
    EXPECT_EQ(denial_of(gateway.execute(id, make_request(1))),
              denial_reason_t::revoked);
    clock.advance(kMillisecondsPerDay);
  }
}

TEST_F(gateway_fixture, expired_denial_applies_lazy_transition) {
  auto id = create(100, 250, 3);
  clock.advance(kHour + 1);

  EXPECT_EQ(denial_of(gateway.execute(id, make_request(1))),
            denial_reason_t::expired);
  auto state = registry.get(id);
  ASSERT_TRUE(state.has_value());
  EXPECT_FALSE(state->is_active);
  EXPECT_FALSE(state->is_revoked);

  EXPECT_EQ(denial_of(gateway.execute(id, make_request(1))),
            denial_reason_t::inactive);
}

TEST_F(gateway_fixture, submission_failure_does_not_consume_quota) {
  auto id = create(100, 100, 3);
  auto failing = keyward::execution::gateway{
      registry, keyward::testing::make_failing_submitter("nonce too low"),
      clock.source()};

  auto result = failing.execute(id, make_request(100));
  ASSERT_TRUE(std::holds_alternative<execution_error_t>(result));
  const auto& error = std::get<execution_error_t>(result);
  EXPECT_EQ(error.kind, execution_error_kind_t::submission_failed);
  EXPECT_FALSE(error.reason.has_value());
  EXPECT_EQ(error.cause, "nonce too low");
  EXPECT_EQ(usage_count(id), 0u);

  auto limits =
      gateway.check_limits(id, 100, make_address(1), "transfer");
  EXPECT_TRUE(limits.can_execute_transaction);
  EXPECT_EQ(limits.daily_amount_used, amount_t{0});
  EXPECT_TRUE(std::holds_alternative<execution_receipt_t>(
      gateway.execute(id, make_request(100))));
}

TEST_F(gateway_fixture, throwing_signer_maps_to_submission_failure) {
  auto id = create(100, 100, 3);
  auto throwing = keyward::execution::gateway{
      registry,
      [](const signing_identity_t&, const execution_request_t&)
          -> keyward::execution::submission_result_t {
        throw std::runtime_error{"rpc timeout"};
      },
      clock.source()};

  auto result = throwing.execute(id, make_request(100));
  ASSERT_TRUE(std::holds_alternative<execution_error_t>(result));
  EXPECT_EQ(std::get<execution_error_t>(result).kind,
            execution_error_kind_t::submission_failed);
  EXPECT_EQ(std::get<execution_error_t>(result).cause, "rpc timeout");
  EXPECT_TRUE(
      gateway.check_limits(id, 100, make_address(1), "transfer")
          .can_execute_transaction);
}

// A reference means the transaction was submitted; whether it later reverts
// on chain is outside the engine, so the quota stays spent.
TEST_F(gateway_fixture, reverted_submission_still_consumes_quota) {
  auto id = create(100, 100, 3);
  ASSERT_TRUE(std::holds_alternative<execution_receipt_t>(
      gateway.execute(id, make_request(100))));
  auto limits = gateway.check_limits(id, 1, make_address(1), "transfer");
  EXPECT_EQ(limits.limit_reached_reason,
            denial_reason_t::daily_amount_limit_exceeded);
  EXPECT_EQ(limits.remaining_daily_amount, amount_t{0});
}

TEST_F(gateway_fixture, quota_usage_is_monotonic_within_a_day) {
  auto id = create(100, 1'000, 10);
  auto previous = amount_t{0};
  for (auto i = 1; i <= 5; ++i) {
    ASSERT_TRUE(std::holds_alternative<execution_receipt_t>(
        gateway.execute(id, make_request(10 * i))));
    clock.advance(1'000);
    auto limits = gateway.check_limits(id, 0, make_address(1), "transfer");
    EXPECT_GE(limits.daily_amount_used, previous);
    previous = limits.daily_amount_used;
  }
  EXPECT_EQ(previous, amount_t{150});
}

TEST_F(gateway_fixture, check_limits_reports_without_recording) {
  auto id = create(100, 250, 3);
  ASSERT_TRUE(std::holds_alternative<execution_receipt_t>(
      gateway.execute(id, make_request(40))));

  auto limits = gateway.check_limits(id, 50, make_address(1), "approve");
  EXPECT_TRUE(limits.can_execute_transaction);
  EXPECT_EQ(limits.daily_amount_used, amount_t{40});
  EXPECT_EQ(limits.remaining_daily_amount, amount_t{210});
  EXPECT_EQ(limits.transaction_count_used, 1u);
  EXPECT_EQ(limits.remaining_transaction_count, 2u);
  EXPECT_EQ(usage_count(id), 1u);
}

TEST_F(gateway_fixture, confirmation_required_without_handler_is_declined) {
  auto config = make_config(clock.now->load(), 100, 250, 3);
  config.require_user_confirmation = true;
  auto id = std::get<session_id_t>(registry.create(alice, config));

  auto result = gateway.execute(id, make_request(10));
  ASSERT_TRUE(std::holds_alternative<execution_error_t>(result));
  EXPECT_EQ(std::get<execution_error_t>(result).kind,
            execution_error_kind_t::confirmation_declined);
  EXPECT_EQ(submitter.calls->load(), 0u);
  EXPECT_EQ(gateway.check_limits(id, 0, make_address(1), "transfer")
                .transaction_count_used,
            0u);
}

TEST_F(gateway_fixture, confirmation_handler_gates_submission) {
  auto config = make_config(clock.now->load(), 100, 250, 3);
  config.require_user_confirmation = true;
  auto id = std::get<session_id_t>(registry.create(alice, config));

  auto approve = true;
  auto confirming = keyward::execution::gateway{
      registry, submitter.submitter(), clock.source(),
      [&](const session_id_t& session_id, const execution_request_t& request) {
        EXPECT_EQ(session_id, id);
        EXPECT_EQ(request.amount, amount_t{10});
        return approve;
      }};

  EXPECT_TRUE(std::holds_alternative<execution_receipt_t>(
      confirming.execute(id, make_request(10))));
  approve = false;
  auto declined = confirming.execute(id, make_request(10));
  ASSERT_TRUE(std::holds_alternative<execution_error_t>(declined));
  EXPECT_EQ(std::get<execution_error_t>(declined).kind,
            execution_error_kind_t::confirmation_declined);
  EXPECT_EQ(usage_count(id), 1u);
}
