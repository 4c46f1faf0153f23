#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace keyward::schema {

/// Name table shared by every enum that has a stable wire/log name.
template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> enum_from_name(const std::string_view name,
                                             const enum_names_t<Enum, N>& names) {
  for (const auto& [candidate, value] : names) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view enum_to_name(const Enum value,
                                        const enum_names_t<Enum, N>& names) {
  for (const auto& [name, candidate] : names) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace keyward::schema
