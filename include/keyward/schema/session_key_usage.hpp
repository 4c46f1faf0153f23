#pragma once
#include <keyward/schema/primitives.hpp>
#include <string>

// Schema type: session key usage.
// One ledger entry per action accepted by the external signer.
namespace keyward::schema {

template <uint16_t Version>
struct session_key_usage;

template <>
struct session_key_usage<1> final {
  uint16_t version{1};
  transaction_reference_t reference;
  amount_t amount{};
  timestamp_milliseconds_t timestamp{};
  address_t contract_address{};
  std::string method_name;
  uint64_t gas_limit{};
};

using session_key_usage_t = session_key_usage<1>;

}  // namespace keyward::schema
