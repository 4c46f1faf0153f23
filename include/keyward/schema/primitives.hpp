#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace keyward::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

using session_id_t = hash32_t;
using principal_t = address_t;  // Owning user wallet
using transaction_reference_t = std::string;

inline constexpr auto kMillisecondsPerDay = duration_milliseconds_t{86'400'000};

bytes_t make_bytes(const std::string_view& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_address(const std::string_view& hex);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

/// `0x`-prefixed lower-case rendering used in logs and the CLI.
std::string to_string(const address_t& address);
std::string to_string(const hash32_t& hash);

}  // namespace keyward::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
