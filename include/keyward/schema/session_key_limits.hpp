#pragma once
#include <keyward/schema/denial_reason.hpp>
#include <keyward/schema/primitives.hpp>
#include <optional>

// Schema type: session key limits.
// Point-in-time quota view; recomputed on every check.
namespace keyward::schema {

template <uint16_t Version>
struct session_key_limits;

template <>
struct session_key_limits<1> final {
  uint16_t version{1};
  amount_t daily_amount_used{};
  uint32_t transaction_count_used{};
  amount_t remaining_daily_amount{};
  uint32_t remaining_transaction_count{};
  bool can_execute_transaction{false};
  std::optional<denial_reason_t> limit_reached_reason;
};

using session_key_limits_t = session_key_limits<1>;

}  // namespace keyward::schema
