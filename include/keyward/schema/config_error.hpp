#pragma once

#include <keyward/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: config error.
// Reasons a session key config is rejected at creation.
namespace keyward::schema {

enum class config_error_t : uint8_t {
  empty_allowed_contracts = 0,
  empty_allowed_methods = 1,
  invalid_expiration = 2,
  zero_transaction_count = 3
};

inline constexpr auto kConfigErrorNames = enum_names_t<config_error_t, 4>{
    std::pair{std::string_view{"empty_allowed_contracts"},
              config_error_t::empty_allowed_contracts},
    std::pair{std::string_view{"empty_allowed_methods"},
              config_error_t::empty_allowed_methods},
    std::pair{std::string_view{"invalid_expiration"},
              config_error_t::invalid_expiration},
    std::pair{std::string_view{"zero_transaction_count"},
              config_error_t::zero_transaction_count}};

template <>
inline std::optional<config_error_t> try_from_string<config_error_t>(
    const std::string_view value) {
  return enum_from_name(value, kConfigErrorNames);
}

inline constexpr std::string_view to_string(const config_error_t value) {
  return enum_to_name(value, kConfigErrorNames);
}

}  // namespace keyward::schema
