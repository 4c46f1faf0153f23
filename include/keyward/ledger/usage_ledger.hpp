#pragma once

#include <keyward/schema/primitives.hpp>
#include <keyward/schema/session_key_usage.hpp>
#include <keyward/schema/usage_statistics.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace keyward::ledger {

using usage_log_t = std::vector<keyward::schema::session_key_usage_t>;

/// Aggregate for a single calendar day.
struct daily_totals_t final {
  keyward::schema::amount_t amount{};
  uint32_t count{};
};

/// UTC calendar day index (days since 1970-01-01).
constexpr uint64_t calendar_day(
    const keyward::schema::timestamp_milliseconds_t timestamp) {
  return timestamp / keyward::schema::kMillisecondsPerDay;
}

/// `YYYY-MM-DD` for a calendar day index.
std::string format_calendar_day(uint64_t day);

/// Append one record. Existing entries are never touched.
void append(usage_log_t& log, keyward::schema::session_key_usage_t record);

/// Sum of amounts and number of entries whose timestamp falls on `day`.
daily_totals_t daily_totals(
    std::span<const keyward::schema::session_key_usage_t> log,
    uint64_t day);

/// Lifetime roll-up. `average_amount` is floor(total_amount / total_count).
keyward::schema::usage_statistics_t statistics(
    std::span<const keyward::schema::session_key_usage_t> log);

}  // namespace keyward::ledger
