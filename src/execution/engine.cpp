#include <spdlog/spdlog.h>
#include <aegis/execution/engine.hpp>
#include <aegis/schema/query_error_code.hpp>

#include <tuple>

namespace aegis::execution {

namespace {

constexpr auto kQueryCodespace = std::string_view{"aegis.query"};

aegis::schema::query_result_t make_query_error(
    const aegis::schema::query_error_code code,
    std::string log,
    const aegis::schema::bytes_view_t& key) {
  auto result = aegis::schema::query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = aegis::schema::make_bytes(key);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

}  // namespace

engine::engine(engine_config_t config)
    : config_{std::move(config)},
      encoder_{},
      storage_{aegis::storage::make_storage<
          aegis::storage::rocksdb_storage_tag>(config_.db_path)},
      store_{encoder_, storage_},
      modules_{},
      delegations_{std::make_shared<delegation_registry>(
          store_, config_.registry_admin)},
      spending_{std::make_shared<spending_limit_hook>(store_)},
      validation_{store_, modules_, *delegations_},
      accounts_{store_, modules_, validation_, config_.entry_point},
      guardians_{
          std::make_shared<guardian_recovery_validator>(store_, accounts_)} {
  spdlog::info("Initializing account engine with RocksDB path '{}'",
               config_.db_path);
  modules_.add(std::shared_ptr<validator_module>{delegations_});
  modules_.add(std::shared_ptr<validator_module>{guardians_});
  modules_.add(std::shared_ptr<hook_module>{spending_});
  if (aegis::schema::is_null(config_.entry_point)) {
    spdlog::warn("No entry point configured; only direct calls are accepted");
  }
  spdlog::info("Account engine ready");
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  validation_.set_signature_verifier(verifier);
  delegations_->set_signature_verifier(std::move(verifier));
}

void engine::set_call_target(call_target_t target) {
  accounts_.set_call_target(std::move(target));
}

account_core& engine::accounts() {
  return accounts_;
}

validation_manager& engine::validation() {
  return validation_;
}

delegation_registry& engine::delegations() {
  return *delegations_;
}

guardian_recovery_validator& engine::guardians() {
  return *guardians_;
}

spending_limit_hook& engine::spending() {
  return *spending_;
}

module_registry& engine::modules() {
  return modules_;
}

aegis::schema::query_result_t engine::query(
    const std::string_view path,
    const aegis::schema::bytes_view_t& key) {
  auto result = aegis::schema::query_result_t{};
  result.key = aegis::schema::make_bytes(key);
  result.codespace = std::string{kQueryCodespace};

  auto respond = [&](const auto& maybe_value) {
    if (!maybe_value.has_value()) {
      return make_query_error(aegis::schema::query_error_code::not_found,
                              "not found", key);
    }
    result.value = encoder_.encode(*maybe_value);
    return result;
  };
  auto invalid_key = [&] {
    return make_query_error(aegis::schema::query_error_code::invalid_key,
                            "invalid key", key);
  };

  if (path == "/account") {
    auto account = encoder_.try_decode<aegis::schema::account_id_t>(key);
    if (!account.has_value()) {
      return invalid_key();
    }
    return respond(accounts_.get_account(*account));
  }
  if (path == "/delegation") {
    auto request = encoder_.try_decode<
        std::tuple<aegis::schema::delegation_id_t, uint64_t>>(key);
    if (!request.has_value()) {
      return invalid_key();
    }
    const auto& [id, now] = *request;
    return respond(delegations_->get_delegation(id, now));
  }
  if (path == "/delegations/by_delegator") {
    auto request = encoder_.try_decode<
        std::tuple<aegis::schema::account_id_t, uint64_t>>(key);
    if (!request.has_value()) {
      return invalid_key();
    }
    const auto& [delegator, now] = *request;
    result.value =
        encoder_.encode(delegations_->list_delegations(delegator, now));
    return result;
  }
  if (path == "/guardian/config") {
    auto account = encoder_.try_decode<aegis::schema::account_id_t>(key);
    if (!account.has_value()) {
      return invalid_key();
    }
    return respond(guardians_->get_config(*account));
  }
  if (path == "/guardian/request") {
    auto account = encoder_.try_decode<aegis::schema::account_id_t>(key);
    if (!account.has_value()) {
      return invalid_key();
    }
    return respond(guardians_->get_request(*account));
  }
  if (path == "/spending/limit") {
    auto request = encoder_.try_decode<
        std::tuple<aegis::schema::account_id_t, aegis::schema::asset_id_t,
                   uint64_t>>(key);
    if (!request.has_value()) {
      return invalid_key();
    }
    const auto& [account, asset, now] = *request;
    return respond(spending_->get_spending_limit(account, asset, now));
  }
  if (path == "/events/range") {
    auto request = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(key);
    if (!request.has_value()) {
      return invalid_key();
    }
    const auto& [from, to] = *request;
    if (from > to) {
      return invalid_key();
    }
    result.value = encoder_.encode(events(from, to));
    return result;
  }

  spdlog::debug("Unsupported query path '{}'", path);
  return make_query_error(aegis::schema::query_error_code::unsupported_path,
                          "unsupported path", key);
}

std::vector<aegis::schema::account_event_record_t> engine::events(
    const uint64_t from,
    const uint64_t to) const {
  auto out = std::vector<aegis::schema::account_event_record_t>{};
  if (from > to) {
    return out;
  }
  auto last = to - from >= kMaxEventRange ? from + kMaxEventRange - 1 : to;
  for (auto id = from;; ++id) {
    auto record = store_.get_event(id);
    if (!record.has_value()) {
      break;
    }
    out.push_back(std::move(*record));
    if (id == last) {
      break;
    }
  }
  return out;
}

std::vector<std::pair<std::string_view, std::size_t>> engine::keyspace_sizes()
    const {
  auto out = std::vector<std::pair<std::string_view, std::size_t>>{};
  for (const auto& keyspace : aegis::schema::key::kEngineKeyspaces) {
    auto prefix =
        aegis::schema::key::make_keyspace_prefix(store_.encoder(), keyspace);
    auto entries = store_.list_by_prefix(
        aegis::schema::bytes_view_t{prefix.data(), prefix.size()});
    out.emplace_back(keyspace, entries.size());
  }
  return out;
}

}  // namespace aegis::execution
