#include <keyward/schema/session_key_tier.hpp>

#include <utility>

namespace keyward::schema {

amount_t whole_tokens(const uint64_t count) {
  static const auto kBaseUnitsPerToken =
      amount_t{"1000000000000000000"};
  return amount_t{count} * kBaseUnitsPerToken;
}

session_key_config_t make_session_key_config(
    const session_key_tier_t tier,
    const timestamp_milliseconds_t now,
    const duration_milliseconds_t duration,
    std::vector<address_t> allowed_contracts) {
  auto config = session_key_config_t{};
  config.expiration_time = now + duration;
  config.allowed_contracts = std::move(allowed_contracts);
  config.emergency_revocation = true;

  switch (tier) {
    case session_key_tier_t::micro:
      config.max_transaction_amount = whole_tokens(1);
      config.max_daily_amount = whole_tokens(10);
      config.max_transaction_count = 50;
      config.allowed_methods = {"transfer", "approve"};
      config.require_user_confirmation = false;
      break;
    case session_key_tier_t::standard:
      config.max_transaction_amount = whole_tokens(100);
      config.max_daily_amount = whole_tokens(1'000);
      config.max_transaction_count = 20;
      config.allowed_methods = {"depositAndSplit", "transferBetweenBuckets",
                                "withdraw"};
      config.require_user_confirmation = false;
      break;
    case session_key_tier_t::high_value:
      config.max_transaction_amount = whole_tokens(10'000);
      config.max_daily_amount = whole_tokens(100'000);
      config.max_transaction_count = 5;
      config.allowed_methods = {"processPayroll", "batchTransfer"};
      config.require_user_confirmation = true;
      break;
  }
  return config;
}

}  // namespace keyward::schema
