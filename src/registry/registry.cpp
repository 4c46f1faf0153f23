#include <keyward/blake3/hash.hpp>
#include <keyward/common/critical.hpp>
#include <keyward/crypto/identity.hpp>
#include <keyward/ledger/usage_ledger.hpp>
#include <keyward/lifecycle/transitions.hpp>
#include <keyward/policy/evaluator.hpp>
#include <keyward/registry/registry.hpp>
#include <keyward/schema/key/builder.hpp>
#include <keyward/schema/key/session_key_state.hpp>

#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

using namespace keyward::schema;

namespace keyward::registry {

namespace {

template <typename T>
void normalize(std::vector<T>& values) {
  std::sort(std::begin(values), std::end(values));
  values.erase(std::unique(std::begin(values), std::end(values)),
               std::end(values));
}

session_key_state_t strip_capability(session_key_state_t state) {
  state.identity.capability.reset();
  return state;
}

}  // namespace

std::optional<config_error_t> validate(const session_key_config_t& config) {
  if (config.allowed_contracts.empty()) {
    return config_error_t::empty_allowed_contracts;
  }
  if (config.allowed_methods.empty()) {
    return config_error_t::empty_allowed_methods;
  }
  if (config.expiration_time <= config.created_at) {
    return config_error_t::invalid_expiration;
  }
  if (config.max_transaction_count == 0) {
    return config_error_t::zero_transaction_count;
  }
  return std::nullopt;
}

registry::registry(keyward::common::clock_source_t clock,
                   key_material_provider_t key_material_provider)
    : clock_{std::move(clock)},
      key_material_provider_{std::move(key_material_provider)} {
  if (!clock_) {
    clock_ = keyward::common::system_clock_source();
  }
  if (!key_material_provider_) {
    key_material_provider_ = keyward::crypto::generate_identity;
  }
}

registry::registry(rocksdb_storage_t& storage,
                   keyward::common::clock_source_t clock,
                   key_material_provider_t key_material_provider)
    : registry(std::move(clock), std::move(key_material_provider)) {
  storage_ = &storage;
  load_persisted_state();
}

creation_result_t registry::create(const principal_t& principal,
                                   session_key_config_t config) {
  auto created_at = now();
  config.created_at = created_at;
  normalize(config.allowed_contracts);
  normalize(config.allowed_methods);
  if (auto error = validate(config)) {
    spdlog::warn("Rejected session key config for {}: {}",
                 to_string(principal), to_string(*error));
    return *error;
  }

  auto identity = key_material_provider_();

  auto entry = std::make_shared<session_entry>();
  entry->state.principal = principal;
  entry->state.identity = std::move(identity);
  entry->state.config = std::move(config);

  auto session_id = session_id_t{};
  {
    auto lock = std::unique_lock{mutex_};
    session_id = next_session_id(principal, created_at);
    entry->state.session_id = session_id;
    entries_.emplace(session_id, entry);
  }
  {
    auto lock = std::scoped_lock{entry->mutex};
    persist(*entry);
  }

  spdlog::info("Created session key {} for {} (signer {}, expires at {})",
               to_string(session_id), to_string(principal),
               to_string(entry->state.identity.address),
               entry->state.config.expiration_time);
  return session_id;
}

std::optional<session_key_state_t> registry::get(
    const session_id_t& session_id) const {
  auto entry = find(session_id);
  if (!entry) {
    return std::nullopt;
  }
  auto lock = std::scoped_lock{entry->mutex};
  return entry->state;
}

std::vector<session_id_t> registry::list_active(
    const principal_t& principal,
    const std::optional<address_t>& contract) const {
  auto current = now();
  auto matches = std::vector<std::pair<timestamp_milliseconds_t, session_id_t>>{};
  for (const auto& entry : entries()) {
    auto lock = std::scoped_lock{entry->mutex};
    const auto& state = entry->state;
    if (state.principal != principal || state.is_revoked || !state.is_active ||
        keyward::policy::is_expired(state, current)) {
      continue;
    }
    if (contract.has_value() &&
        !keyward::policy::allows_contract(state.config, *contract)) {
      continue;
    }
    matches.emplace_back(state.config.created_at, state.session_id);
  }
  std::stable_sort(std::begin(matches), std::end(matches),
                   [](const auto& lhs, const auto& rhs) {
                     return lhs.first > rhs.first;
                   });

  auto ids = std::vector<session_id_t>{};
  ids.reserve(matches.size());
  for (const auto& [created_at, id] : matches) {
    ids.push_back(id);
  }
  return ids;
}

uint64_t registry::cleanup_expired() {
  return cleanup_expired_at(now());
}

uint64_t registry::cleanup_expired_at(const timestamp_milliseconds_t now) {
  auto count = uint64_t{};
  for (const auto& entry : entries()) {
    auto lock = std::scoped_lock{entry->mutex};
    if (keyward::lifecycle::expire_if_due(entry->state, now)) {
      persist(*entry);
      ++count;
    }
  }
  if (count > 0) {
    spdlog::info("Expired {} session key(s)", count);
  }
  return count;
}

bool registry::append_usage(const session_id_t& session_id,
                            session_key_usage_t record) {
  auto entry = find(session_id);
  if (!entry) {
    return false;
  }
  auto lock = std::scoped_lock{entry->mutex};
  keyward::ledger::append(entry->state.usage, std::move(record));
  persist(*entry);
  return true;
}

std::optional<usage_statistics_t> registry::usage_statistics(
    const session_id_t& session_id) const {
  auto entry = find(session_id);
  if (!entry) {
    return std::nullopt;
  }
  auto lock = std::scoped_lock{entry->mutex};
  return keyward::ledger::statistics(entry->state.usage);
}

std::optional<keyward::ledger::daily_totals_t> registry::daily_totals(
    const session_id_t& session_id,
    const uint64_t day) const {
  auto entry = find(session_id);
  if (!entry) {
    return std::nullopt;
  }
  auto lock = std::scoped_lock{entry->mutex};
  return keyward::ledger::daily_totals(entry->state.usage, day);
}

principal_statistics_t registry::principal_statistics(
    const principal_t& principal) const {
  auto current = now();
  auto stats = principal_statistics_t{};
  for (const auto& entry : entries()) {
    auto lock = std::scoped_lock{entry->mutex};
    const auto& state = entry->state;
    if (state.principal != principal) {
      continue;
    }
    ++stats.total;
    if (state.is_revoked) {
      ++stats.revoked;
    } else if (!state.is_active || keyward::policy::is_expired(state, current)) {
      ++stats.expired;
    } else {
      ++stats.active;
    }
    stats.total_transactions += state.usage.size();
    for (const auto& usage : state.usage) {
      stats.total_amount += usage.amount;
    }
  }
  return stats;
}

std::vector<session_key_state_t> registry::export_records(
    const principal_t& principal) const {
  auto records = std::vector<session_key_state_t>{};
  for (const auto& entry : entries()) {
    auto lock = std::scoped_lock{entry->mutex};
    if (entry->state.principal == principal) {
      records.push_back(strip_capability(entry->state));
    }
  }
  return records;
}

session_entry_ptr registry::find(const session_id_t& session_id) const {
  auto lock = std::shared_lock{mutex_};
  auto it = entries_.find(session_id);
  if (it == std::end(entries_)) {
    return nullptr;
  }
  return it->second;
}

std::vector<session_entry_ptr> registry::entries() const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<session_entry_ptr>{};
  out.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) {
    out.push_back(entry);
  }
  return out;
}

void registry::persist(const session_entry& entry) const {
  if (storage_ == nullptr) {
    return;
  }
  auto key = keyward::schema::key::make_key(entry.state);
  storage_->put(encoder_, bytes_view_t{key}, entry.state);
}

timestamp_milliseconds_t registry::now() const {
  return clock_();
}

session_id_t registry::next_session_id(const principal_t& principal,
                                       const timestamp_milliseconds_t now) {
  while (true) {
    auto nonce = std::array<uint8_t, 16>{};
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
      keyward::common::critical("failed to draw session id entropy");
    }
    auto material = keyward::schema::key::builder{};
    material.write(std::span<const uint8_t>{principal.data(), principal.size()})
        .write(now)
        .write(sequence_++)
        .write(std::span<const uint8_t>{nonce.data(), nonce.size()});
    auto id = keyward::blake3::hash(
        std::span<const uint8_t>{material.data.data(), material.data.size()});
    if (!entries_.contains(id)) {
      return id;
    }
  }
}

void registry::load_persisted_state() {
  auto prefix = keyward::schema::key::make_session_key_prefix();
  auto records = storage_->list_by_prefix(bytes_view_t{prefix});
  for (const auto& [key, value] : records) {
    auto state = encoder_.try_decode<session_key_state_t>(bytes_view_t{value});
    if (!state.has_value()) {
      spdlog::error("Undecodable session key record under {}",
                    to_hex(bytes_view_t{key}));
      keyward::common::critical("failed to decode persisted session key");
    }
    auto entry = std::make_shared<session_entry>();
    entry->state = std::move(*state);
    entries_.emplace(entry->state.session_id, std::move(entry));
  }
  spdlog::info("Loaded {} persisted session key(s)", entries_.size());
}

}  // namespace keyward::registry
