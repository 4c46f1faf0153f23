#pragma once
#include <keyward/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: session key config.
// Spend limits, time bounds and allow-lists fixed at creation.
namespace keyward::schema {

template <uint16_t Version>
struct session_key_config;

template <>
struct session_key_config<1> final {
  uint16_t version{1};
  amount_t max_transaction_amount{};
  amount_t max_daily_amount{};
  uint32_t max_transaction_count{};
  timestamp_milliseconds_t expiration_time{};
  timestamp_milliseconds_t created_at{};
  std::vector<address_t> allowed_contracts;
  std::vector<std::string> allowed_methods;
  bool require_user_confirmation{false};
  bool emergency_revocation{true};
};

using session_key_config_t = session_key_config<1>;

}  // namespace keyward::schema
