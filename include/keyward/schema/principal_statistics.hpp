#pragma once
#include <keyward/schema/primitives.hpp>

// Schema type: principal statistics.
// Roll-up over every credential a wallet owns.
namespace keyward::schema {

template <uint16_t Version>
struct principal_statistics;

template <>
struct principal_statistics<1> final {
  uint16_t version{1};
  uint64_t total{};
  uint64_t active{};
  uint64_t expired{};
  uint64_t revoked{};
  uint64_t total_transactions{};
  amount_t total_amount{};
};

using principal_statistics_t = principal_statistics<1>;

}  // namespace keyward::schema
