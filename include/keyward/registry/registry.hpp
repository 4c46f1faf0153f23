#pragma once

#include <keyward/common/clock.hpp>
#include <keyward/ledger/usage_ledger.hpp>
#include <keyward/schema/config_error.hpp>
#include <keyward/schema/encoding/scale/encoder.hpp>
#include <keyward/schema/primitives.hpp>
#include <keyward/schema/principal_statistics.hpp>
#include <keyward/schema/session_key_config.hpp>
#include <keyward/schema/session_key_state.hpp>
#include <keyward/schema/session_key_usage.hpp>
#include <keyward/schema/signing_identity.hpp>
#include <keyward/schema/usage_statistics.hpp>
#include <keyward/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <variant>
#include <vector>

namespace keyward::registry {

using scale_encoder_t = keyward::schema::encoding::encoder<
    keyward::schema::encoding::scale_encoder_tag>;
using rocksdb_storage_t =
    keyward::storage::storage<keyward::storage::rocksdb_storage_tag>;

/// Produces the signing identity bound to a new credential.
using key_material_provider_t =
    std::function<keyward::schema::signing_identity_t()>;

using creation_result_t = std::variant<keyward::schema::session_id_t,
                                       keyward::schema::config_error_t>;

/// One credential plus the quota held by admitted but unsettled executions.
/// `mutex` guards every other member. Reservation tags are unique per entry,
/// whichever gateway issued them.
struct session_entry final {
  std::mutex mutex;
  keyward::schema::session_key_state_t state;
  std::vector<keyward::schema::session_key_usage_t> reservations;
  uint64_t next_reservation{};
};

using session_entry_ptr = std::shared_ptr<session_entry>;

/// Owner of every session key in the process.
///
/// Entries are created once and never removed. When constructed over a
/// storage backend, all persisted records are loaded up front and every
/// mutation is written through while the entry lock is held.
class registry final {
 public:
  explicit registry(
      keyward::common::clock_source_t clock =
          keyward::common::system_clock_source(),
      key_material_provider_t key_material_provider = {});

  registry(rocksdb_storage_t& storage,
           keyward::common::clock_source_t clock =
               keyward::common::system_clock_source(),
           key_material_provider_t key_material_provider = {});

  registry(const registry&) = delete;
  registry& operator=(const registry&) = delete;

  /// Validate `config`, stamp `created_at` and bind a fresh signing identity.
  /// Nothing is stored when validation fails.
  creation_result_t create(const keyward::schema::principal_t& principal,
                           keyward::schema::session_key_config_t config);

  /// Coherent copy of a credential, or std::nullopt when unknown.
  std::optional<keyward::schema::session_key_state_t> get(
      const keyward::schema::session_id_t& session_id) const;

  /// Active, unrevoked, unexpired credentials of `principal`, newest first.
  /// When `contract` is set only credentials allowing it are returned.
  std::vector<keyward::schema::session_id_t> list_active(
      const keyward::schema::principal_t& principal,
      const std::optional<keyward::schema::address_t>& contract =
          std::nullopt) const;

  /// Deactivate every overdue credential; returns how many this call moved.
  uint64_t cleanup_expired();
  uint64_t cleanup_expired_at(keyward::schema::timestamp_milliseconds_t now);

  /// Append a settled usage record to a credential's ledger.
  bool append_usage(const keyward::schema::session_id_t& session_id,
                    keyward::schema::session_key_usage_t record);

  /// Lifetime usage roll-up of one credential, taken under its lock.
  std::optional<keyward::schema::usage_statistics_t> usage_statistics(
      const keyward::schema::session_id_t& session_id) const;

  /// Settled usage of one credential on calendar `day`.
  std::optional<keyward::ledger::daily_totals_t> daily_totals(
      const keyward::schema::session_id_t& session_id,
      uint64_t day) const;

  keyward::schema::principal_statistics_t principal_statistics(
      const keyward::schema::principal_t& principal) const;

  /// Backup view of a principal's credentials. Signing capabilities are
  /// stripped.
  std::vector<keyward::schema::session_key_state_t> export_records(
      const keyward::schema::principal_t& principal) const;

  /// Shared handle on a credential entry for callers that need to hold its
  /// lock across several steps.
  session_entry_ptr find(const keyward::schema::session_id_t& session_id) const;

  /// Snapshot of every entry handle, in id order.
  std::vector<session_entry_ptr> entries() const;

  /// Write `entry.state` through to storage. Caller holds `entry.mutex`.
  void persist(const session_entry& entry) const;

  keyward::schema::timestamp_milliseconds_t now() const;

 private:
  keyward::schema::session_id_t next_session_id(
      const keyward::schema::principal_t& principal,
      keyward::schema::timestamp_milliseconds_t now);
  void load_persisted_state();

  mutable std::shared_mutex mutex_;
  std::map<keyward::schema::session_id_t, session_entry_ptr> entries_;
  rocksdb_storage_t* storage_{nullptr};
  mutable scale_encoder_t encoder_;
  keyward::common::clock_source_t clock_;
  key_material_provider_t key_material_provider_;
  uint64_t sequence_{};
};

/// Reject configs that can never admit anything.
std::optional<keyward::schema::config_error_t> validate(
    const keyward::schema::session_key_config_t& config);

}  // namespace keyward::registry
