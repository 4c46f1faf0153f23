#include <keyward/ledger/usage_ledger.hpp>

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <map>
#include <utility>

namespace keyward::ledger {

std::string format_calendar_day(const uint64_t day) {
  auto date = std::chrono::year_month_day{std::chrono::sys_days{
      std::chrono::days{static_cast<std::chrono::days::rep>(day)}}};
  return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()));
}

void append(usage_log_t& log, keyward::schema::session_key_usage_t record) {
  log.push_back(std::move(record));
}

daily_totals_t daily_totals(
    const std::span<const keyward::schema::session_key_usage_t> log,
    const uint64_t day) {
  auto totals = daily_totals_t{};
  for (const auto& entry : log) {
    if (calendar_day(entry.timestamp) != day) {
      continue;
    }
    totals.amount += entry.amount;
    ++totals.count;
  }
  return totals;
}

keyward::schema::usage_statistics_t statistics(
    const std::span<const keyward::schema::session_key_usage_t> log) {
  auto result = keyward::schema::usage_statistics_t{};
  auto by_day = std::map<uint64_t, daily_totals_t>{};

  for (const auto& entry : log) {
    ++result.total_count;
    result.total_amount += entry.amount;
    auto& bucket = by_day[calendar_day(entry.timestamp)];
    bucket.amount += entry.amount;
    ++bucket.count;
  }

  if (result.total_count > 0) {
    // cpp_int division truncates, which is floor for unsigned values.
    result.average_amount =
        result.total_amount / keyward::schema::amount_t{result.total_count};
    result.last_used = log.back().timestamp;
  }

  result.per_day.reserve(by_day.size());
  for (const auto& [day, totals] : by_day) {
    result.per_day.push_back(keyward::schema::daily_usage_t{
        .day = day,
        .date = format_calendar_day(day),
        .count = totals.count,
        .amount = totals.amount});
  }
  return result;
}

}  // namespace keyward::ledger
