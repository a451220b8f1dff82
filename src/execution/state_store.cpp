#include <aegis/common/critical.hpp>
#include <aegis/execution/state_store.hpp>

#include <iterator>

namespace aegis::execution {

state_overlay::state_overlay(state_overlay* parent) : parent_{parent} {}

state_overlay* state_overlay::parent() const {
  return parent_;
}

const std::optional<aegis::schema::bytes_t>* state_overlay::find(
    const aegis::schema::bytes_t& key) const {
  auto it = staged_.find(key);
  if (it != std::end(staged_)) {
    return &it->second;
  }
  if (parent_ == nullptr) {
    return nullptr;
  }
  return parent_->find(key);
}

void state_overlay::stage(aegis::schema::bytes_t key,
                          std::optional<aegis::schema::bytes_t> value,
                          const bool durable) {
  if (durable) {
    durable_.insert(key);
  }
  staged_[std::move(key)] = std::move(value);
}

void state_overlay::retain_staged_on_failure() {
  retain_ = true;
}

bool state_overlay::is_kept(const aegis::schema::bytes_t& key,
                            const bool committed) const {
  return committed || retain_ || durable_.contains(key);
}

std::vector<aegis::storage::write_entry_t> state_overlay::kept_entries(
    const bool committed) const {
  auto entries = std::vector<aegis::storage::write_entry_t>{};
  for (const auto& [key, value] : staged_) {
    if (is_kept(key, committed)) {
      entries.emplace_back(key, value);
    }
  }
  return entries;
}

void state_overlay::absorb(const state_overlay& child, const bool committed) {
  for (const auto& [key, value] : child.staged_) {
    if (!child.is_kept(key, committed)) {
      continue;
    }
    // Whatever outlived a rejected child stays durable in its parent.
    stage(key, value, !committed || child.durable_.contains(key));
  }
}

state_store::state_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

encoder_t& state_store::encoder() const {
  return encoder_;
}

std::optional<aegis::schema::bytes_t> state_store::get_raw(
    const aegis::schema::bytes_t& key) const {
  auto lock = std::scoped_lock{mutex_};
  if (active_ != nullptr) {
    const auto* staged = active_->find(key);
    if (staged != nullptr) {
      return *staged;
    }
  }
  return storage_.get_raw(
      aegis::schema::bytes_view_t{key.data(), key.size()});
}

void state_store::erase(const aegis::schema::bytes_t& key) {
  stage(key, std::nullopt, false);
}

void state_store::retain_on_failure() {
  auto lock = std::scoped_lock{mutex_};
  if (active_ == nullptr) {
    aegis::common::critical("retain requested outside of a transaction");
  }
  active_->retain_staged_on_failure();
}

uint64_t state_store::next_sequence(const aegis::schema::bytes_t& key,
                                    const bool durable) {
  auto current = get<uint64_t>(key).value_or(0);
  stage(key, encoder_.encode(current + 1), durable);
  return current;
}

uint64_t state_store::append_event(
    aegis::schema::account_event_record_t record,
    const bool durable) {
  auto lock = std::scoped_lock{mutex_};
  record.event_id = next_sequence(
      aegis::schema::key::make_event_sequence_key(encoder_), durable);
  stage(aegis::schema::key::make_event_key(encoder_, record.event_id),
        encoder_.encode(record), durable);
  return record.event_id;
}

std::optional<aegis::schema::account_event_record_t> state_store::get_event(
    const uint64_t event_id) const {
  return get<aegis::schema::account_event_record_t>(
      aegis::schema::key::make_event_key(encoder_, event_id));
}

std::vector<aegis::storage::key_value_entry_t> state_store::list_by_prefix(
    const aegis::schema::bytes_view_t& prefix) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.list_by_prefix(prefix);
}

void state_store::stage(aegis::schema::bytes_t key,
                        std::optional<aegis::schema::bytes_t> value,
                        const bool durable) {
  auto lock = std::scoped_lock{mutex_};
  if (active_ == nullptr) {
    aegis::common::critical("state write outside of a transaction");
  }
  active_->stage(std::move(key), std::move(value), durable);
}

void state_store::record_denial(
    const std::string_view operation,
    const aegis::schema::account_id_t& account,
    const aegis::schema::timestamp_milliseconds_t now,
    const aegis::schema::error_code_t code) {
  append_event(
      aegis::schema::account_event_record_t{
          .type = aegis::schema::account_event_type_t::operation_denied,
          .account_id = account,
          .code = static_cast<uint32_t>(code),
          .message = aegis::schema::make_bytes(operation),
          .recorded_at = now},
      true);
}

void state_store::publish(const state_overlay& overlay, const bool committed) {
  if (active_ != nullptr) {
    active_->absorb(overlay, committed);
    return;
  }
  auto entries = overlay.kept_entries(committed);
  if (!entries.empty()) {
    storage_.write_batch(entries);
  }
}

}  // namespace aegis::execution
