#pragma once

#include <keyward/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: denial reason.
// Ordered policy outcomes; declaration order matches evaluation order.
namespace keyward::schema {

enum class denial_reason_t : uint8_t {
  not_found = 0,
  revoked = 1,
  inactive = 2,
  expired = 3,
  contract_not_allowed = 4,
  method_not_allowed = 5,
  per_transaction_limit_exceeded = 6,
  daily_amount_limit_exceeded = 7,
  daily_count_limit_exceeded = 8
};

/// Coarse grouping used to route denials to distinct log levels.
enum class denial_category_t : uint8_t {
  credential = 0,
  scope = 1,
  quota = 2
};

inline constexpr auto kDenialReasonNames =
    enum_names_t<denial_reason_t, 9>{
        std::pair{std::string_view{"not_found"}, denial_reason_t::not_found},
        std::pair{std::string_view{"revoked"}, denial_reason_t::revoked},
        std::pair{std::string_view{"inactive"}, denial_reason_t::inactive},
        std::pair{std::string_view{"expired"}, denial_reason_t::expired},
        std::pair{std::string_view{"contract_not_allowed"},
                  denial_reason_t::contract_not_allowed},
        std::pair{std::string_view{"method_not_allowed"},
                  denial_reason_t::method_not_allowed},
        std::pair{std::string_view{"per_transaction_limit_exceeded"},
                  denial_reason_t::per_transaction_limit_exceeded},
        std::pair{std::string_view{"daily_amount_limit_exceeded"},
                  denial_reason_t::daily_amount_limit_exceeded},
        std::pair{std::string_view{"daily_count_limit_exceeded"},
                  denial_reason_t::daily_count_limit_exceeded}};

template <>
inline std::optional<denial_reason_t> try_from_string<denial_reason_t>(
    const std::string_view value) {
  return enum_from_name(value, kDenialReasonNames);
}

inline constexpr std::string_view to_string(const denial_reason_t value) {
  return enum_to_name(value, kDenialReasonNames);
}

inline constexpr denial_category_t category(const denial_reason_t value) {
  switch (value) {
    case denial_reason_t::contract_not_allowed:
    case denial_reason_t::method_not_allowed:
      return denial_category_t::scope;
    case denial_reason_t::per_transaction_limit_exceeded:
    case denial_reason_t::daily_amount_limit_exceeded:
    case denial_reason_t::daily_count_limit_exceeded:
      return denial_category_t::quota;
    default:
      return denial_category_t::credential;
  }
}

}  // namespace keyward::schema
