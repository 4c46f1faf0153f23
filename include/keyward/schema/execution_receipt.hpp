#pragma once
#include <keyward/schema/primitives.hpp>
#include <string>

namespace keyward::schema {

template <uint16_t Version>
struct execution_receipt;

template <>
struct execution_receipt<1> final {
  uint16_t version{1};
  session_id_t session_id{};
  transaction_reference_t reference;
  amount_t amount{};
  timestamp_milliseconds_t submitted_at{};
  address_t contract_address{};
  std::string method_name;
};

using execution_receipt_t = execution_receipt<1>;

}  // namespace keyward::schema
