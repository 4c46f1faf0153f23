#pragma once

#include <keyward/schema/enum_string.hpp>
#include <keyward/schema/session_key_config.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

// Schema type: session key tier.
// Preset quota envelopes for common automation flows.
namespace keyward::schema {

enum class session_key_tier_t : uint8_t {
  micro = 0,
  standard = 1,
  high_value = 2
};

inline constexpr auto kSessionKeyTierNames =
    enum_names_t<session_key_tier_t, 3>{
        std::pair{std::string_view{"micro"}, session_key_tier_t::micro},
        std::pair{std::string_view{"standard"}, session_key_tier_t::standard},
        std::pair{std::string_view{"high_value"},
                  session_key_tier_t::high_value}};

template <>
inline std::optional<session_key_tier_t> try_from_string<session_key_tier_t>(
    const std::string_view value) {
  return enum_from_name(value, kSessionKeyTierNames);
}

inline constexpr std::string_view to_string(const session_key_tier_t value) {
  return enum_to_name(value, kSessionKeyTierNames);
}

/// 10^18 base units.
amount_t whole_tokens(uint64_t count);

/// Build a config from a tier preset. `created_at` is left for the registry
/// to stamp.
session_key_config_t make_session_key_config(
    session_key_tier_t tier,
    timestamp_milliseconds_t now,
    duration_milliseconds_t duration,
    std::vector<address_t> allowed_contracts);

}  // namespace keyward::schema
