#pragma once

#include <keyward/common/clock.hpp>
#include <keyward/execution/collaborators.hpp>
#include <keyward/registry/registry.hpp>
#include <keyward/schema/primitives.hpp>
#include <keyward/schema/session_key_config.hpp>
#include <keyward/schema/session_key_usage.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace keyward::testing {

// 2024-03-15T12:00:00Z
inline constexpr auto kNoon = keyward::schema::timestamp_milliseconds_t{
    1'710'504'000'000};
inline constexpr auto kHour = keyward::schema::duration_milliseconds_t{
    3'600'000};

/// Settable time source shared between a test and the components under test.
struct manual_clock final {
  std::shared_ptr<std::atomic<keyward::schema::timestamp_milliseconds_t>> now =
      std::make_shared<std::atomic<keyward::schema::timestamp_milliseconds_t>>(
          kNoon);

  keyward::common::clock_source_t source() const {
    return [now = now] { return now->load(); };
  }

  void set(const keyward::schema::timestamp_milliseconds_t value) {
    now->store(value);
  }

  void advance(const keyward::schema::duration_milliseconds_t delta) {
    now->fetch_add(delta);
  }
};

inline keyward::schema::address_t make_address(const uint8_t seed) {
  auto out = keyward::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline keyward::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = keyward::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Provider that skips key generation; the capability stays empty.
inline keyward::registry::key_material_provider_t make_fake_key_provider() {
  auto counter = std::make_shared<std::atomic<uint8_t>>(0);
  return [counter] {
    auto identity = keyward::schema::signing_identity_t{};
    identity.address = make_address(static_cast<uint8_t>(0xA0 + (*counter)++));
    return identity;
  };
}

/// Config allowing `transfer` and `approve` on make_address(1), valid for one
/// hour from `now`.
inline keyward::schema::session_key_config_t make_config(
    const keyward::schema::timestamp_milliseconds_t now,
    const uint64_t max_per_transaction,
    const uint64_t max_daily,
    const uint32_t max_count) {
  auto config = keyward::schema::session_key_config_t{};
  config.max_transaction_amount = max_per_transaction;
  config.max_daily_amount = max_daily;
  config.max_transaction_count = max_count;
  config.created_at = now;
  config.expiration_time = now + kHour;
  config.allowed_contracts = {make_address(1)};
  config.allowed_methods = {"transfer", "approve"};
  return config;
}

inline keyward::schema::session_key_usage_t make_usage(
    const keyward::schema::timestamp_milliseconds_t timestamp,
    const uint64_t amount) {
  auto usage = keyward::schema::session_key_usage_t{};
  usage.reference = "0xtx" + std::to_string(timestamp);
  usage.amount = amount;
  usage.timestamp = timestamp;
  usage.contract_address = make_address(1);
  usage.method_name = "transfer";
  return usage;
}

inline keyward::schema::execution_request_t make_request(
    const uint64_t amount,
    const std::string_view method = "transfer") {
  auto request = keyward::schema::execution_request_t{};
  request.contract_address = make_address(1);
  request.method_name = std::string{method};
  request.amount = amount;
  request.payload = keyward::schema::bytes_t{0xDE, 0xAD};
  return request;
}

/// Submitter that succeeds with sequential references and counts calls.
struct counting_submitter final {
  std::shared_ptr<std::atomic<uint64_t>> calls =
      std::make_shared<std::atomic<uint64_t>>(0);

  keyward::execution::transaction_submitter_t submitter() const {
    return [calls = calls](const keyward::schema::signing_identity_t&,
                           const keyward::schema::execution_request_t&)
               -> keyward::execution::submission_result_t {
      auto n = ++(*calls);
      return keyward::schema::transaction_reference_t{"0xtx" +
                                                      std::to_string(n)};
    };
  }
};

inline keyward::execution::transaction_submitter_t make_failing_submitter(
    const std::string& cause) {
  return [cause](const keyward::schema::signing_identity_t&,
                 const keyward::schema::execution_request_t&)
             -> keyward::execution::submission_result_t {
    return keyward::execution::submission_failure_t{cause};
  };
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace keyward::testing
