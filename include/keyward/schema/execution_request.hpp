#pragma once
#include <keyward/schema/primitives.hpp>
#include <optional>
#include <string>

namespace keyward::schema {

template <uint16_t Version>
struct execution_request;

template <>
struct execution_request<1> final {
  uint16_t version{1};
  address_t contract_address{};
  std::string method_name;
  amount_t amount{};
  bytes_t payload;
  std::optional<uint64_t> gas_limit;
};

using execution_request_t = execution_request<1>;

}  // namespace keyward::schema
