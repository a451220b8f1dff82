#include <spdlog/spdlog.h>
#include <aegis/execution/accounts.hpp>
#include <aegis/execution/guardian_recovery_validator.hpp>

#include <algorithm>
#include <iterator>
#include <string>

namespace aegis::execution {

namespace {

bool contains(const std::vector<aegis::schema::signer_id_t>& values,
              const aegis::schema::signer_id_t& value) {
  return std::find(std::begin(values), std::end(values), value) !=
         std::end(values);
}

}  // namespace

bool is_valid_guardian_config(const aegis::schema::guardian_config_t& config) {
  if (config.threshold < kMinGuardianThreshold ||
      config.threshold > config.guardians.size() ||
      config.recovery_delay == 0) {
    return false;
  }
  for (auto it = std::begin(config.guardians); it != std::end(config.guardians);
       ++it) {
    if (aegis::schema::is_null(*it) ||
        std::find(std::next(it), std::end(config.guardians), *it) !=
            std::end(config.guardians)) {
      return false;
    }
  }
  return true;
}

guardian_recovery_validator::guardian_recovery_validator(
    state_store& store,
    account_core& accounts)
    : store_{store}, accounts_{accounts}, module_id_{module_id()} {}

aegis::schema::module_id_t guardian_recovery_validator::module_id() {
  return make_module_id("aegis.module.guardian_recovery_validator");
}

const aegis::schema::module_id_t& guardian_recovery_validator::id() const {
  return module_id_;
}

bool guardian_recovery_validator::is_module_type(
    const aegis::schema::module_type_t type) const {
  return type == aegis::schema::module_type_t::validator;
}

template <typename Mutator>
status_t guardian_recovery_validator::update_config(
    const std::string_view operation,
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    Mutator&& mutate) {
  return store_.transact(operation, account, context.now, [&] {
    auto state = load_account(store_, account);
    if (!state.has_value() || context.caller != state->root_authority) {
      return make_error(aegis::schema::error_code_t::unauthorized,
                        kGuardianCodespace,
                        "only the root authority may change guardians");
    }
    auto config = get_config(account);
    if (!config.has_value()) {
      return make_error(aegis::schema::error_code_t::module_state_error,
                        kGuardianCodespace,
                        "guardian recovery is not installed");
    }
    auto mutated = mutate(*config);
    if (!mutated.ok()) {
      return mutated;
    }
    if (!is_valid_guardian_config(*config)) {
      return make_error(aegis::schema::error_code_t::invalid_config,
                        kGuardianCodespace,
                        "guardian config violates threshold or delay rules");
    }
    store_.put(
        aegis::schema::key::make_guardian_config_key(store_.encoder(), account),
        *config);
    // Approvals only count while their guardian stays in the set.
    auto request = get_request(account);
    if (request.has_value()) {
      auto approvals = request->approvals.size();
      std::erase_if(request->approvals, [&](const auto& approver) {
        return !contains(config->guardians, approver);
      });
      if (request->approvals.size() != approvals) {
        request->approval_count =
            static_cast<uint32_t>(request->approvals.size());
        store_.put(aegis::schema::key::make_recovery_request_key(
                       store_.encoder(), account),
                   *request);
      }
    }
    record(aegis::schema::account_event_type_t::guardian_config_updated,
           account, context.now);
    return make_ok();
  });
}

status_t guardian_recovery_validator::on_install(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::bytes_view_t& init_data) {
  auto init =
      store_.encoder().try_decode<aegis::schema::guardian_config_init_t>(
          init_data);
  if (!init.has_value()) {
    return make_error(aegis::schema::error_code_t::invalid_config,
                      kGuardianCodespace, "malformed guardian config");
  }
  auto config = aegis::schema::guardian_config_t{
      .account_id = account,
      .guardians = init->guardians,
      .threshold = init->threshold,
      .recovery_delay = init->recovery_delay};
  if (!is_valid_guardian_config(config)) {
    return make_error(aegis::schema::error_code_t::invalid_config,
                      kGuardianCodespace,
                      "guardian config violates threshold or delay rules");
  }
  store_.put(
      aegis::schema::key::make_guardian_config_key(store_.encoder(), account),
      config);
  spdlog::info("Configured {}-of-{} guardian recovery for account {}",
               config.threshold, config.guardians.size(),
               aegis::schema::to_log_string(account));
  record(aegis::schema::account_event_type_t::guardian_config_updated,
         account, context.now);
  return make_ok();
}

status_t guardian_recovery_validator::on_uninstall(
    const call_context_t&,
    const aegis::schema::account_id_t& account,
    const aegis::schema::bytes_view_t&) {
  auto& encoder = store_.encoder();
  store_.erase(aegis::schema::key::make_guardian_config_key(encoder, account));
  store_.erase(aegis::schema::key::make_recovery_request_key(encoder, account));
  return make_ok();
}

status_t guardian_recovery_validator::validate_operation(
    const call_context_t&,
    const aegis::schema::operation_t&) {
  return make_error(aegis::schema::error_code_t::unauthorized,
                    kGuardianCodespace,
                    "guardian recovery authorizes no operations");
}

status_t guardian_recovery_validator::is_valid_signature(
    const aegis::schema::account_id_t&,
    const aegis::schema::hash32_t&,
    const aegis::schema::signer_id_t&,
    const aegis::schema::signature_t&,
    aegis::schema::timestamp_milliseconds_t) {
  return make_error(aegis::schema::error_code_t::unauthorized,
                    kGuardianCodespace,
                    "guardian recovery accepts no signatures");
}

status_t guardian_recovery_validator::initiate_recovery(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::signer_id_t& new_root) {
  return store_.transact("initiate_recovery", account, context.now, [&] {
    auto allowed = require_guardian(context, account);
    if (!allowed.ok()) {
      return allowed;
    }
    if (get_request(account).has_value()) {
      return make_error(aegis::schema::error_code_t::recovery_already_initiated,
                        kGuardianCodespace,
                        "a recovery request is already outstanding");
    }
    if (aegis::schema::is_null(new_root)) {
      return make_error(aegis::schema::error_code_t::invalid_validator,
                        kGuardianCodespace, "proposed root authority is null");
    }
    store_.put(
        aegis::schema::key::make_recovery_request_key(store_.encoder(),
                                                      account),
        aegis::schema::recovery_request_t{.account_id = account,
                                          .new_root_authority = new_root,
                                          .initiated_by = context.caller,
                                          .initiated_at = context.now,
                                          .approval_count = 0});
    spdlog::info("Guardian {} initiated recovery of account {}",
                 aegis::schema::to_log_string(context.caller),
                 aegis::schema::to_log_string(account));
    record(aegis::schema::account_event_type_t::recovery_initiated, account,
           context.now);
    return make_ok();
  });
}

status_t guardian_recovery_validator::approve_recovery(
    const call_context_t& context,
    const aegis::schema::account_id_t& account) {
  return store_.transact("approve_recovery", account, context.now, [&] {
    auto allowed = require_guardian(context, account);
    if (!allowed.ok()) {
      return allowed;
    }
    auto request = get_request(account);
    if (!request.has_value()) {
      return make_error(aegis::schema::error_code_t::recovery_not_initiated,
                        kGuardianCodespace, "no recovery request outstanding");
    }
    if (contains(request->approvals, context.caller)) {
      return make_error(aegis::schema::error_code_t::already_approved,
                        kGuardianCodespace, "guardian already approved");
    }
    request->approvals.push_back(context.caller);
    ++request->approval_count;
    store_.put(aegis::schema::key::make_recovery_request_key(store_.encoder(),
                                                             account),
               *request);
    record(aegis::schema::account_event_type_t::recovery_approved, account,
           context.now);
    return make_ok();
  });
}

status_t guardian_recovery_validator::execute_recovery(
    const call_context_t& context,
    const aegis::schema::account_id_t& account) {
  return store_.transact("execute_recovery", account, context.now, [&] {
    auto allowed = require_guardian(context, account);
    if (!allowed.ok()) {
      return allowed;
    }
    auto config = get_config(account);
    auto request = get_request(account);
    if (!request.has_value()) {
      return make_error(aegis::schema::error_code_t::recovery_not_initiated,
                        kGuardianCodespace, "no recovery request outstanding");
    }
    if (context.now < request->initiated_at ||
        context.now - request->initiated_at < config->recovery_delay) {
      return make_error(aegis::schema::error_code_t::recovery_delay_not_passed,
                        kGuardianCodespace, "recovery delay has not passed");
    }
    if (request->approval_count < config->threshold) {
      return make_error(aegis::schema::error_code_t::threshold_not_met,
                        kGuardianCodespace,
                        "approvals " + std::to_string(request->approval_count) +
                            " below threshold " +
                            std::to_string(config->threshold));
    }
    auto recovered = accounts_.recover_root_authority(
        call_context_t{aegis::schema::named_signer_t{module_id_}, context.now},
        account, request->new_root_authority);
    if (!recovered.ok()) {
      return recovered;
    }
    store_.erase(aegis::schema::key::make_recovery_request_key(
        store_.encoder(), account));
    spdlog::info("Executed guardian recovery of account {}",
                 aegis::schema::to_log_string(account));
    record(aegis::schema::account_event_type_t::recovery_executed, account,
           context.now);
    return make_ok();
  });
}

status_t guardian_recovery_validator::cancel_recovery(
    const call_context_t& context,
    const aegis::schema::account_id_t& account) {
  return store_.transact("cancel_recovery", account, context.now, [&] {
    auto state = load_account(store_, account);
    if (!state.has_value() || !is_account_controller(*state, context.caller)) {
      return make_error(aegis::schema::error_code_t::unauthorized,
                        kGuardianCodespace,
                        "only the root authority may cancel recovery");
    }
    if (!get_request(account).has_value()) {
      return make_error(aegis::schema::error_code_t::recovery_not_initiated,
                        kGuardianCodespace, "no recovery request outstanding");
    }
    store_.erase(aegis::schema::key::make_recovery_request_key(
        store_.encoder(), account));
    spdlog::info("Cancelled recovery of account {}",
                 aegis::schema::to_log_string(account));
    record(aegis::schema::account_event_type_t::recovery_cancelled, account,
           context.now);
    return make_ok();
  });
}

status_t guardian_recovery_validator::add_guardian(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::signer_id_t& guardian) {
  return update_config(
      "add_guardian", context, account,
      [&](aegis::schema::guardian_config_t& config) {
        if (contains(config.guardians, guardian)) {
          return make_error(aegis::schema::error_code_t::invalid_config,
                            kGuardianCodespace, "guardian already present");
        }
        config.guardians.push_back(guardian);
        return make_ok();
      });
}

status_t guardian_recovery_validator::remove_guardian(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::signer_id_t& guardian) {
  return update_config(
      "remove_guardian", context, account,
      [&](aegis::schema::guardian_config_t& config) {
        if (!contains(config.guardians, guardian)) {
          return make_error(aegis::schema::error_code_t::invalid_config,
                            kGuardianCodespace, "not a guardian");
        }
        std::erase(config.guardians, guardian);
        return make_ok();
      });
}

status_t guardian_recovery_validator::update_threshold(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const uint32_t threshold) {
  return update_config("update_threshold", context, account,
                       [&](aegis::schema::guardian_config_t& config) {
                         config.threshold = threshold;
                         return make_ok();
                       });
}

status_t guardian_recovery_validator::update_recovery_delay(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::duration_milliseconds_t recovery_delay) {
  return update_config("update_recovery_delay", context, account,
                       [&](aegis::schema::guardian_config_t& config) {
                         config.recovery_delay = recovery_delay;
                         return make_ok();
                       });
}

std::optional<aegis::schema::guardian_config_t>
guardian_recovery_validator::get_config(
    const aegis::schema::account_id_t& account) const {
  return store_.get<aegis::schema::guardian_config_t>(
      aegis::schema::key::make_guardian_config_key(store_.encoder(), account));
}

std::optional<aegis::schema::recovery_request_t>
guardian_recovery_validator::get_request(
    const aegis::schema::account_id_t& account) const {
  return store_.get<aegis::schema::recovery_request_t>(
      aegis::schema::key::make_recovery_request_key(store_.encoder(), account));
}

bool guardian_recovery_validator::is_guardian(
    const aegis::schema::account_id_t& account,
    const aegis::schema::signer_id_t& identity) const {
  auto config = get_config(account);
  return config.has_value() && contains(config->guardians, identity);
}

status_t guardian_recovery_validator::require_guardian(
    const call_context_t& context,
    const aegis::schema::account_id_t& account) const {
  if (!is_guardian(account, context.caller)) {
    return make_error(aegis::schema::error_code_t::unauthorized,
                      kGuardianCodespace, "caller is not a guardian");
  }
  return make_ok();
}

void guardian_recovery_validator::record(
    const aegis::schema::account_event_type_t type,
    const aegis::schema::account_id_t& account,
    const aegis::schema::timestamp_milliseconds_t now) {
  store_.append_event(aegis::schema::account_event_record_t{
      .type = type, .account_id = account, .subject = module_id_,
      .recorded_at = now});
}

}  // namespace aegis::execution
