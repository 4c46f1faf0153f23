#pragma once
#include <keyward/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

namespace keyward::schema {

struct daily_usage_t final {
  uint64_t day{};
  std::string date;  // YYYY-MM-DD, UTC
  uint32_t count{};
  amount_t amount{};
};

template <uint16_t Version>
struct usage_statistics;

template <>
struct usage_statistics<1> final {
  uint16_t version{1};
  uint64_t total_count{};
  amount_t total_amount{};
  amount_t average_amount{};
  std::optional<timestamp_milliseconds_t> last_used;
  std::vector<daily_usage_t> per_day;
};

using usage_statistics_t = usage_statistics<1>;

}  // namespace keyward::schema
