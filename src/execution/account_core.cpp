#include <spdlog/spdlog.h>
#include <aegis/execution/account_core.hpp>
#include <aegis/execution/accounts.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace aegis::execution {

account_core::in_flight_guard::in_flight_guard(
    std::set<aegis::schema::account_id_t>& accounts,
    const aegis::schema::account_id_t& account)
    : accounts_{accounts}, account_{account} {
  acquired_ = accounts_.insert(account_).second;
}

account_core::in_flight_guard::~in_flight_guard() {
  if (acquired_) {
    accounts_.erase(account_);
  }
}

bool account_core::in_flight_guard::acquired() const {
  return acquired_;
}

account_core::account_core(state_store& store,
                           module_registry& modules,
                           validation_manager& validation,
                           aegis::schema::signer_id_t entry_point)
    : store_{store},
      modules_{modules},
      validation_{validation},
      entry_point_{std::move(entry_point)},
      call_target_{[](const call_context_t&, const aegis::schema::operation_t&) {
        return call_outcome_t{};
      }} {}

void account_core::set_call_target(call_target_t target) {
  call_target_ = std::move(target);
}

aegis::schema::account_id_t account_core::compute_address(
    const aegis::schema::signer_id_t& root_authority,
    const aegis::schema::hash32_t& salt) const {
  return make_account_id(store_.encoder(), root_authority, salt);
}

result<aegis::schema::account_id_t> account_core::create_account(
    const call_context_t& context,
    const aegis::schema::signer_id_t& root_authority,
    const aegis::schema::signer_id_t& emergency_identity,
    const aegis::schema::hash32_t& salt) {
  auto account_id = compute_address(root_authority, salt);
  return store_.transact("create_account", account_id, context.now, [&] {
    if (aegis::schema::is_null(root_authority)) {
      return make_error<aegis::schema::account_id_t>(
          aegis::schema::error_code_t::invalid_validator, kAccountCodespace,
          "root authority is null");
    }
    if (load_account(store_, account_id).has_value()) {
      return make_error<aegis::schema::account_id_t>(
          aegis::schema::error_code_t::account_exists, kAccountCodespace,
          "account already exists");
    }
    auto account = aegis::schema::account_state_t{
        .account_id = account_id,
        .root_authority = root_authority,
        .emergency_identity = emergency_identity,
        .salt = salt,
        .created_at = context.now,
        .last_activity_at = context.now};
    save_account(store_, account);
    if (aegis::schema::is_null(emergency_identity)) {
      spdlog::warn("Account {} created without an emergency identity",
                   aegis::schema::to_log_string(account_id));
    }
    spdlog::info("Created account {} with root authority {}",
                 aegis::schema::to_log_string(account_id),
                 aegis::schema::to_log_string(root_authority));
    record(aegis::schema::account_event_type_t::account_created, account_id,
           std::nullopt, context.now);
    return make_ok(account_id);
  });
}

template <typename T, typename Fn>
result<T> account_core::with_account(
    const std::string_view operation,
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    Fn&& fn) {
  return store_.transact(operation, account, context.now, [&]() -> result<T> {
    auto guard = in_flight_guard{in_flight_, account};
    if (!guard.acquired()) {
      return make_error<T>(aegis::schema::error_code_t::reentrant_call,
                           kAccountCodespace,
                           "account already has an operation in flight");
    }
    auto state = load_account(store_, account);
    if (!state.has_value()) {
      return make_error<T>(aegis::schema::error_code_t::account_not_found,
                           kAccountCodespace, "account does not exist");
    }
    return fn(*state);
  });
}

result<aegis::schema::bytes_t> account_core::execute(
    const call_context_t& context,
    const aegis::schema::operation_t& operation) {
  return with_account<aegis::schema::bytes_t>(
      "execute", context, operation.account,
      [&](aegis::schema::account_state_t& account) {
        auto allowed = authorize(context, account, operation);
        if (!allowed.ok()) {
          return forward_error<aegis::schema::bytes_t>(allowed);
        }
        // Hooks see the identity that authorized the operation.
        auto initiator = context;
        if (context.caller == entry_point_) {
          initiator.caller = operation.signer;
        }
        return run_with_hooks(initiator, account, operation);
      });
}

result<aegis::schema::bytes_t> account_core::execute_from_executor(
    const call_context_t& context,
    const aegis::schema::operation_t& operation) {
  return with_account<aegis::schema::bytes_t>(
      "execute_from_executor", context, operation.account,
      [&](aegis::schema::account_state_t& account) {
        const auto* executor =
            std::get_if<aegis::schema::named_signer_t>(&context.caller);
        if (executor == nullptr ||
            !has_installed_module(account,
                                  aegis::schema::module_type_t::executor,
                                  *executor) ||
            !modules_.find_executor(*executor)) {
          return make_error<aegis::schema::bytes_t>(
              aegis::schema::error_code_t::unauthorized, kAccountCodespace,
              "caller is not an installed executor");
        }
        return run_with_hooks(context, account, operation);
      });
}

status_t account_core::install_module(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::module_type_t type,
    const aegis::schema::module_id_t& module_id,
    const aegis::schema::bytes_view_t& init_data) {
  return with_account<std::monostate>(
      "install_module", context, account,
      [&](aegis::schema::account_state_t& state) {
        if (!is_account_controller(state, context.caller)) {
          return make_error(aegis::schema::error_code_t::unauthorized,
                            kAccountCodespace,
                            "caller is not the account or its root authority");
        }
        auto handle = aegis::schema::is_zero(module_id)
                          ? std::nullopt
                          : modules_.find(module_id);
        if (!handle.has_value()) {
          return make_error(aegis::schema::error_code_t::module_state_error,
                            kAccountCodespace, "unknown module");
        }
        auto& target = as_module(*handle);
        if (!target.is_module_type(type) || handle_type(*handle) != type) {
          return make_error(aegis::schema::error_code_t::module_state_error,
                            kAccountCodespace,
                            "module does not implement the requested type");
        }
        if (has_installed_module(state, type, module_id)) {
          return make_error(aegis::schema::error_code_t::module_state_error,
                            kAccountCodespace, "module already installed");
        }
        auto initialized = target.on_install(
            call_context_t{aegis::schema::make_account_signer(account),
                           context.now},
            account, init_data);
        if (!initialized.ok()) {
          return initialized;
        }
        state.installed_modules.push_back(
            aegis::schema::installed_module_t{.type = type,
                                              .module_id = module_id});
        touch(state, context.now);
        spdlog::info("Installed {} module {} on account {}",
                     aegis::schema::to_string(type),
                     aegis::schema::to_log_string(module_id),
                     aegis::schema::to_log_string(account));
        record(aegis::schema::account_event_type_t::module_installed, account,
               module_id, context.now);
        return make_ok();
      });
}

status_t account_core::uninstall_module(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::module_type_t type,
    const aegis::schema::module_id_t& module_id,
    const aegis::schema::bytes_view_t& deinit_data) {
  return with_account<std::monostate>(
      "uninstall_module", context, account,
      [&](aegis::schema::account_state_t& state) {
        if (!is_account_controller(state, context.caller)) {
          return make_error(aegis::schema::error_code_t::unauthorized,
                            kAccountCodespace,
                            "caller is not the account or its root authority");
        }
        auto handle = aegis::schema::is_zero(module_id)
                          ? std::nullopt
                          : modules_.find(module_id);
        if (!handle.has_value() ||
            !as_module(*handle).is_module_type(type) ||
            handle_type(*handle) != type) {
          return make_error(aegis::schema::error_code_t::module_state_error,
                            kAccountCodespace,
                            "unknown module or wrong module type");
        }
        if (!has_installed_module(state, type, module_id)) {
          return make_error(aegis::schema::error_code_t::module_state_error,
                            kAccountCodespace, "module is not installed");
        }
        auto cleaned = as_module(*handle).on_uninstall(
            call_context_t{aegis::schema::make_account_signer(account),
                           context.now},
            account, deinit_data);
        if (!cleaned.ok()) {
          return cleaned;
        }
        std::erase(state.installed_modules,
                   aegis::schema::installed_module_t{.type = type,
                                                     .module_id = module_id});
        touch(state, context.now);
        spdlog::info("Uninstalled {} module {} from account {}",
                     aegis::schema::to_string(type),
                     aegis::schema::to_log_string(module_id),
                     aegis::schema::to_log_string(account));
        record(aegis::schema::account_event_type_t::module_uninstalled,
               account, module_id, context.now);
        return make_ok();
      });
}

status_t account_core::set_root_authority(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::signer_id_t& new_root) {
  return with_account<std::monostate>(
      "set_root_authority", context, account,
      [&](aegis::schema::account_state_t& state) {
        if (!is_account_controller(state, context.caller)) {
          return make_error(aegis::schema::error_code_t::unauthorized,
                            kAccountCodespace,
                            "caller is not the account or its root authority");
        }
        return assign_root(
            context, state, new_root,
            aegis::schema::account_event_type_t::root_authority_changed);
      });
}

status_t account_core::recover_root_authority(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::signer_id_t& new_root) {
  return with_account<std::monostate>(
      "recover_root_authority", context, account,
      [&](aegis::schema::account_state_t& state) {
        const auto* validator =
            std::get_if<aegis::schema::named_signer_t>(&context.caller);
        if (validator == nullptr ||
            !has_installed_module(state,
                                  aegis::schema::module_type_t::validator,
                                  *validator) ||
            !modules_.find_validator(*validator)) {
          return make_error(aegis::schema::error_code_t::unauthorized,
                            kAccountCodespace,
                            "caller is not an installed validator");
        }
        return assign_root(
            context, state, new_root,
            aegis::schema::account_event_type_t::root_authority_changed);
      });
}

status_t account_core::emergency_recovery(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::signer_id_t& new_root) {
  return with_account<std::monostate>(
      "emergency_recovery", context, account,
      [&](aegis::schema::account_state_t& state) {
        if (aegis::schema::is_null(state.emergency_identity) ||
            context.caller != state.emergency_identity) {
          return make_error(aegis::schema::error_code_t::unauthorized,
                            kAccountCodespace,
                            "caller is not the emergency identity");
        }
        if (context.now <= state.last_activity_at ||
            context.now - state.last_activity_at <= kEmergencyDelay) {
          return make_error(
              aegis::schema::error_code_t::recovery_delay_not_passed,
              kAccountCodespace, "account was active too recently");
        }
        return assign_root(
            context, state, new_root,
            aegis::schema::account_event_type_t::emergency_recovery_executed);
      });
}

std::optional<aegis::schema::account_state_t> account_core::get_account(
    const aegis::schema::account_id_t& account) const {
  return load_account(store_, account);
}

bool account_core::is_module_installed(
    const aegis::schema::account_id_t& account,
    const aegis::schema::module_type_t type,
    const aegis::schema::module_id_t& module_id) const {
  auto state = load_account(store_, account);
  return state.has_value() && has_installed_module(*state, type, module_id);
}

std::vector<aegis::schema::installed_module_t> account_core::installed_modules(
    const aegis::schema::account_id_t& account) const {
  auto state = load_account(store_, account);
  if (!state.has_value()) {
    return {};
  }
  return state->installed_modules;
}

status_t account_core::authorize(
    const call_context_t& context,
    const aegis::schema::account_state_t& account,
    const aegis::schema::operation_t& operation) {
  if (!aegis::schema::is_null(entry_point_) && context.caller == entry_point_) {
    return validation_.validate(context, account, operation);
  }
  if (is_account_controller(account, context.caller)) {
    return make_ok();
  }
  return make_error(aegis::schema::error_code_t::unauthorized,
                    kAccountCodespace,
                    "caller is neither root authority, account nor entry "
                    "point");
}

result<aegis::schema::bytes_t> account_core::run_with_hooks(
    const call_context_t& context,
    aegis::schema::account_state_t& account,
    const aegis::schema::operation_t& operation) {
  auto tokens = std::vector<
      std::pair<std::shared_ptr<hook_module>, aegis::schema::bytes_t>>{};
  for (const auto& installed : account.installed_modules) {
    if (installed.type != aegis::schema::module_type_t::hook) {
      continue;
    }
    auto hook = modules_.find_hook(installed.module_id);
    if (!hook) {
      return make_error<aegis::schema::bytes_t>(
          aegis::schema::error_code_t::module_state_error, kAccountCodespace,
          "installed hook is not registered");
    }
    auto token = hook->pre_check(context, operation);
    if (!token.ok()) {
      return token;
    }
    tokens.emplace_back(std::move(hook), std::move(*token.value));
  }

  auto outcome = call_target_(context, operation);
  if (!outcome.success) {
    // Hook and delegation accounting stays recorded for the failed call.
    store_.retain_on_failure();
    return make_error<aegis::schema::bytes_t>(
        aegis::schema::error_code_t::execution_failed, kAccountCodespace,
        "call to target failed");
  }

  for (auto it = std::rbegin(tokens); it != std::rend(tokens); ++it) {
    auto checked = it->first->post_check(
        context, operation,
        aegis::schema::bytes_view_t{it->second.data(), it->second.size()});
    if (!checked.ok()) {
      return forward_error<aegis::schema::bytes_t>(checked);
    }
  }

  touch(account, context.now);
  record(aegis::schema::account_event_type_t::operation_executed,
         account.account_id, operation.target, context.now);
  return make_ok(std::move(outcome.return_data));
}

status_t account_core::assign_root(
    const call_context_t& context,
    aegis::schema::account_state_t& account,
    const aegis::schema::signer_id_t& new_root,
    const aegis::schema::account_event_type_t event) {
  if (aegis::schema::is_null(new_root)) {
    return make_error(aegis::schema::error_code_t::invalid_validator,
                      kAccountCodespace, "new root authority is null");
  }
  account.root_authority = new_root;
  touch(account, context.now);
  spdlog::info("Root authority of account {} is now {}",
               aegis::schema::to_log_string(account.account_id),
               aegis::schema::to_log_string(new_root));
  record(event, account.account_id, std::nullopt, context.now);
  return make_ok();
}

void account_core::touch(aegis::schema::account_state_t& account,
                         const aegis::schema::timestamp_milliseconds_t now) {
  account.last_activity_at = now;
  save_account(store_, account);
}

void account_core::record(
    const aegis::schema::account_event_type_t type,
    const aegis::schema::account_id_t& account,
    const std::optional<aegis::schema::hash32_t>& subject,
    const aegis::schema::timestamp_milliseconds_t now) {
  store_.append_event(aegis::schema::account_event_record_t{
      .type = type, .account_id = account, .subject = subject,
      .recorded_at = now});
}

}  // namespace aegis::execution
