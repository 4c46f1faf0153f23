#pragma once

#include <keyward/schema/denial_reason.hpp>
#include <keyward/schema/enum_string.hpp>
#include <keyward/schema/execution_receipt.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace keyward::schema {

enum class execution_error_kind_t : uint8_t {
  policy_denied = 0,
  confirmation_declined = 1,
  submission_failed = 2
};

inline constexpr auto kExecutionErrorKindNames =
    enum_names_t<execution_error_kind_t, 3>{
        std::pair{std::string_view{"policy_denied"},
                  execution_error_kind_t::policy_denied},
        std::pair{std::string_view{"confirmation_declined"},
                  execution_error_kind_t::confirmation_declined},
        std::pair{std::string_view{"submission_failed"},
                  execution_error_kind_t::submission_failed}};

template <>
inline std::optional<execution_error_kind_t>
try_from_string<execution_error_kind_t>(const std::string_view value) {
  return enum_from_name(value, kExecutionErrorKindNames);
}

inline constexpr std::string_view to_string(const execution_error_kind_t value) {
  return enum_to_name(value, kExecutionErrorKindNames);
}

template <uint16_t Version>
struct execution_error;

/// `reason` is set only for `policy_denied`; `cause` carries the signer's
/// message for `submission_failed`.
template <>
struct execution_error<1> final {
  uint16_t version{1};
  execution_error_kind_t kind{execution_error_kind_t::policy_denied};
  std::optional<denial_reason_t> reason;
  std::string cause;
};

using execution_error_t = execution_error<1>;

using execution_result_t = std::variant<execution_receipt_t, execution_error_t>;

}  // namespace keyward::schema
