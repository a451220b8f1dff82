#pragma once

#include <spdlog/spdlog.h>
#include <aegis/execution/result.hpp>
#include <aegis/schema/account_event_record.hpp>
#include <aegis/schema/encoding/scale/encoder.hpp>
#include <aegis/schema/key/engine_keys.hpp>
#include <aegis/schema/primitives.hpp>
#include <aegis/storage/rocksdb/storage.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace aegis::execution {

using encoder_t = aegis::schema::encoding::encoder<
    aegis::schema::encoding::scale_encoder_tag>;
using storage_t =
    aegis::storage::storage<aegis::storage::rocksdb_storage_tag>;

/// Writes staged by one operation on top of its parent operation (or of the
/// committed store when it has none).
///
/// A durable write survives the rollback of the operation that staged it.
class state_overlay final {
 public:
  explicit state_overlay(state_overlay* parent);

  state_overlay* parent() const;

  /// Staged value for `key` in this overlay or any ancestor. Returns nullptr
  /// when nothing is staged; a pointer to std::nullopt marks a delete.
  const std::optional<aegis::schema::bytes_t>* find(
      const aegis::schema::bytes_t& key) const;

  void stage(aegis::schema::bytes_t key,
             std::optional<aegis::schema::bytes_t> value,
             bool durable);

  /// Keep every staged write even when the operation is reported as failed.
  void retain_staged_on_failure();

  /// Writes that outlive the operation given its outcome.
  std::vector<aegis::storage::write_entry_t> kept_entries(bool committed) const;

  /// Fold a finished child operation into this one.
  void absorb(const state_overlay& child, bool committed);

 private:
  bool is_kept(const aegis::schema::bytes_t& key, bool committed) const;

  state_overlay* parent_{nullptr};
  std::map<aegis::schema::bytes_t, std::optional<aegis::schema::bytes_t>>
      staged_;
  std::set<aegis::schema::bytes_t> durable_;
  bool retain_{false};
};

/// Transactional view of the account state database.
///
/// Every mutating engine operation runs inside `transact`: its writes commit
/// as one RocksDB write batch when it succeeds, or are discarded (except
/// durable writes) when it is rejected. Nested operations stage into their
/// caller's overlay.
class state_store final {
 public:
  state_store(encoder_t& encoder, storage_t& storage);

  encoder_t& encoder() const;

  std::optional<aegis::schema::bytes_t> get_raw(
      const aegis::schema::bytes_t& key) const;

  template <typename T>
  std::optional<T> get(const aegis::schema::bytes_t& key) const;

  template <typename T>
  void put(const aegis::schema::bytes_t& key, const T& value);

  /// Write that survives the rollback of the current operation.
  template <typename T>
  void put_durable(const aegis::schema::bytes_t& key, const T& value);

  void erase(const aegis::schema::bytes_t& key);

  /// See state_overlay::retain_staged_on_failure.
  void retain_on_failure();

  /// Read, increment and store the counter at `key`; returns the prior value.
  uint64_t next_sequence(const aegis::schema::bytes_t& key, bool durable);

  /// Assign the next event id to `record` and stage it.
  uint64_t append_event(aegis::schema::account_event_record_t record,
                        bool durable = false);

  std::optional<aegis::schema::account_event_record_t> get_event(
      uint64_t event_id) const;

  /// Committed entries under a key prefix. Staged writes are not visible.
  std::vector<aegis::storage::key_value_entry_t> list_by_prefix(
      const aegis::schema::bytes_view_t& prefix) const;

  /// Run `fn` as one atomic operation on `account` and return its result.
  template <typename Fn>
  std::invoke_result_t<Fn> transact(
      std::string_view operation,
      const aegis::schema::account_id_t& account,
      aegis::schema::timestamp_milliseconds_t now,
      Fn&& fn);

 private:
  void stage(aegis::schema::bytes_t key,
             std::optional<aegis::schema::bytes_t> value,
             bool durable);
  void record_denial(std::string_view operation,
                     const aegis::schema::account_id_t& account,
                     aegis::schema::timestamp_milliseconds_t now,
                     aegis::schema::error_code_t code);
  void publish(const state_overlay& overlay, bool committed);

  encoder_t& encoder_;
  storage_t& storage_;
  mutable std::recursive_mutex mutex_;
  state_overlay* active_{nullptr};
};

template <typename T>
std::optional<T> state_store::get(const aegis::schema::bytes_t& key) const {
  auto raw = get_raw(key);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  return encoder_.decode<T>(
      aegis::schema::bytes_view_t{raw->data(), raw->size()});
}

template <typename T>
void state_store::put(const aegis::schema::bytes_t& key, const T& value) {
  stage(key, encoder_.encode(value), false);
}

template <typename T>
void state_store::put_durable(const aegis::schema::bytes_t& key,
                              const T& value) {
  stage(key, encoder_.encode(value), true);
}

template <typename Fn>
std::invoke_result_t<Fn> state_store::transact(
    const std::string_view operation,
    const aegis::schema::account_id_t& account,
    const aegis::schema::timestamp_milliseconds_t now,
    Fn&& fn) {
  auto lock = std::scoped_lock{mutex_};
  auto overlay = state_overlay{active_};
  active_ = &overlay;
  // Restore the parent overlay on every exit path.
  struct scope final {
    state_overlay*& active;
    state_overlay* parent;
    ~scope() { active = parent; }
  } restore{active_, overlay.parent()};

  auto outcome = fn();
  if (outcome.ok()) {
    spdlog::debug("{} committed for account {}", operation,
                  aegis::schema::to_log_string(account));
  } else {
    spdlog::warn("{} rejected {} for account {}: {} ({})", outcome.codespace,
                 operation, aegis::schema::to_log_string(account),
                 aegis::schema::to_string(outcome.code), outcome.log);
    record_denial(operation, account, now, outcome.code);
  }

  active_ = overlay.parent();
  publish(overlay, outcome.ok());
  return outcome;
}

}  // namespace aegis::execution
