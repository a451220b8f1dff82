#include <spdlog/spdlog.h>
#include <aegis/blake3/hash.hpp>
#include <aegis/crypto/verify.hpp>
#include <aegis/execution/accounts.hpp>
#include <aegis/execution/delegation_registry.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>

namespace aegis::execution {

namespace {

bool selector_allowed(const aegis::schema::delegation_state_t& state,
                      const aegis::schema::selector_t& selector) {
  switch (state.type) {
    case aegis::schema::delegation_type_t::full:
    case aegis::schema::delegation_type_t::executor:
      return true;
    case aegis::schema::delegation_type_t::limited:
      return std::find(std::begin(state.allowed_selectors),
                       std::end(state.allowed_selectors),
                       selector) != std::end(state.allowed_selectors);
    default:
      return false;
  }
}

}  // namespace

aegis::schema::delegation_status_t effective_status(
    const aegis::schema::delegation_state_t& state,
    const aegis::schema::timestamp_milliseconds_t now) {
  if (state.status == aegis::schema::delegation_status_t::active &&
      now > state.end_time) {
    return aegis::schema::delegation_status_t::expired;
  }
  return state.status;
}

delegation_registry::delegation_registry(state_store& store,
                                         aegis::schema::signer_id_t admin)
    : store_{store},
      admin_{std::move(admin)},
      signature_verifier_{aegis::crypto::verify_signature},
      module_id_{module_id()} {}

aegis::schema::module_id_t delegation_registry::module_id() {
  return make_module_id("aegis.module.delegation_registry");
}

void delegation_registry::set_signature_verifier(
    signature_verifier_t verifier) {
  signature_verifier_ = std::move(verifier);
}

const aegis::schema::module_id_t& delegation_registry::id() const {
  return module_id_;
}

bool delegation_registry::is_module_type(
    const aegis::schema::module_type_t type) const {
  return type == aegis::schema::module_type_t::validator;
}

status_t delegation_registry::on_install(const call_context_t&,
                                         const aegis::schema::account_id_t&,
                                         const aegis::schema::bytes_view_t&) {
  return make_ok();
}

status_t delegation_registry::on_uninstall(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::bytes_view_t&) {
  auto& encoder = store_.encoder();
  for (const auto& id : index_of(account)) {
    auto state = load(id);
    if (!state.has_value() ||
        effective_status(*state, context.now) !=
            aegis::schema::delegation_status_t::active) {
      continue;
    }
    state->status = aegis::schema::delegation_status_t::revoked;
    store_.put(aegis::schema::key::make_delegation_key(encoder, id), *state);
    record(aegis::schema::account_event_type_t::delegation_revoked, *state,
           context.now);
  }
  return make_ok();
}

status_t delegation_registry::validate_operation(
    const call_context_t& context,
    const aegis::schema::operation_t& operation) {
  auto id = store_.encoder().try_decode<aegis::schema::delegation_id_t>(
      aegis::schema::bytes_view_t{operation.validation_data.data(),
                                  operation.validation_data.size()});
  if (!id.has_value()) {
    return make_error(aegis::schema::error_code_t::invalid_config,
                      kDelegationCodespace,
                      "validation data is not a delegation id");
  }
  auto state = load(*id);
  if (!state.has_value()) {
    return make_error(aegis::schema::error_code_t::delegation_not_found,
                      kDelegationCodespace, "delegation not found");
  }
  if (state->delegator != operation.account ||
      state->delegatee != operation.signer) {
    return make_error(aegis::schema::error_code_t::unauthorized,
                      kDelegationCodespace,
                      "signer holds no delegation from this account");
  }
  if (state->status != aegis::schema::delegation_status_t::active) {
    return make_error(aegis::schema::error_code_t::delegation_not_active,
                      kDelegationCodespace, "delegation is not active");
  }
  if (context.now <= state->end_time &&
      !selector_allowed(*state, aegis::schema::selector_of(operation))) {
    return make_error(aegis::schema::error_code_t::unauthorized,
                      kDelegationCodespace,
                      "selector is not allowed by the delegation");
  }
  return spend(context, *state, operation.value);
}

status_t delegation_registry::is_valid_signature(
    const aegis::schema::account_id_t& account,
    const aegis::schema::hash32_t& hash,
    const aegis::schema::signer_id_t& signer,
    const aegis::schema::signature_t& signature,
    const aegis::schema::timestamp_milliseconds_t now) {
  if (!has_delegation_of_type(account, signer,
                              {aegis::schema::delegation_type_t::full,
                               aegis::schema::delegation_type_t::validator},
                              now)) {
    return make_error(aegis::schema::error_code_t::unauthorized,
                      kDelegationCodespace,
                      "signer holds no signing delegation");
  }
  if (!signature_verifier_(aegis::schema::bytes_view_t{hash.data(),
                                                       hash.size()},
                           signer, signature)) {
    return make_error(aegis::schema::error_code_t::invalid_signature,
                      kDelegationCodespace, "signature verification failed");
  }
  return make_ok();
}

result<aegis::schema::delegation_id_t> delegation_registry::create_delegation(
    const call_context_t& context,
    const aegis::schema::account_id_t& delegator,
    const aegis::schema::delegation_params_t& params) {
  return store_.transact("create_delegation", delegator, context.now, [&] {
    auto account = load_account(store_, delegator);
    if (!account.has_value()) {
      return make_error<aegis::schema::delegation_id_t>(
          aegis::schema::error_code_t::account_not_found,
          kDelegationCodespace, "delegator account does not exist");
    }
    if (!is_account_controller(*account, context.caller)) {
      return make_error<aegis::schema::delegation_id_t>(
          aegis::schema::error_code_t::unauthorized, kDelegationCodespace,
          "caller is not the delegator or its root authority");
    }
    return create(context, delegator, params);
  });
}

result<aegis::schema::delegation_id_t>
delegation_registry::create_delegation_with_signature(
    const call_context_t& context,
    const aegis::schema::account_id_t& delegator,
    const aegis::schema::delegation_params_t& params,
    const uint64_t nonce,
    const aegis::schema::signature_t& signature) {
  return store_.transact(
      "create_delegation_with_signature", delegator, context.now, [&] {
        auto account = load_account(store_, delegator);
        if (!account.has_value()) {
          return make_error<aegis::schema::delegation_id_t>(
              aegis::schema::error_code_t::account_not_found,
              kDelegationCodespace, "delegator account does not exist");
        }
        auto expected = nonce_of(delegator);
        if (nonce != expected) {
          return make_error<aegis::schema::delegation_id_t>(
              aegis::schema::error_code_t::invalid_nonce,
              kDelegationCodespace,
              "expected nonce " + std::to_string(expected));
        }
        auto digest = signing_digest(delegator, params, nonce);
        if (!signature_verifier_(
                aegis::schema::bytes_view_t{digest.data(), digest.size()},
                account->root_authority, signature)) {
          return make_error<aegis::schema::delegation_id_t>(
              aegis::schema::error_code_t::invalid_signature,
              kDelegationCodespace,
              "signature is not by the delegator's root authority");
        }
        store_.put(aegis::schema::key::make_delegation_nonce_key(
                       store_.encoder(), delegator),
                   nonce + 1);
        return create(context, delegator, params);
      });
}

status_t delegation_registry::revoke_delegation(
    const call_context_t& context,
    const aegis::schema::delegation_id_t& id) {
  auto existing = load(id);
  auto subject =
      existing.has_value() ? existing->delegator : aegis::schema::account_id_t{};
  return store_.transact("revoke_delegation", subject, context.now, [&] {
    auto state = load(id);
    if (!state.has_value()) {
      return make_error(aegis::schema::error_code_t::delegation_not_found,
                        kDelegationCodespace, "delegation not found");
    }
    auto is_admin =
        !aegis::schema::is_null(admin_) && context.caller == admin_;
    auto account = load_account(store_, state->delegator);
    auto is_delegator = account.has_value() &&
                        is_account_controller(*account, context.caller);
    if (!is_admin && !is_delegator) {
      return make_error(aegis::schema::error_code_t::unauthorized,
                        kDelegationCodespace,
                        "only the delegator or the registry admin may revoke");
    }
    if (effective_status(*state, context.now) !=
        aegis::schema::delegation_status_t::active) {
      return make_error(aegis::schema::error_code_t::delegation_not_active,
                        kDelegationCodespace, "delegation is not active");
    }
    state->status = aegis::schema::delegation_status_t::revoked;
    store_.put(aegis::schema::key::make_delegation_key(store_.encoder(), id),
               *state);
    spdlog::info("Revoked delegation {} of account {}",
                 aegis::schema::to_log_string(id),
                 aegis::schema::to_log_string(state->delegator));
    record(aegis::schema::account_event_type_t::delegation_revoked, *state,
           context.now);
    return make_ok();
  });
}

status_t delegation_registry::use_delegation(
    const call_context_t& context,
    const aegis::schema::delegation_id_t& id,
    const aegis::schema::amount_t& amount) {
  auto existing = load(id);
  auto subject =
      existing.has_value() ? existing->delegator : aegis::schema::account_id_t{};
  return store_.transact("use_delegation", subject, context.now, [&] {
    auto state = load(id);
    if (!state.has_value()) {
      return make_error(aegis::schema::error_code_t::delegation_not_found,
                        kDelegationCodespace, "delegation not found");
    }
    if (context.caller != state->delegatee) {
      return make_error(aegis::schema::error_code_t::unauthorized,
                        kDelegationCodespace, "caller is not the delegatee");
    }
    if (state->status != aegis::schema::delegation_status_t::active) {
      return make_error(aegis::schema::error_code_t::delegation_not_active,
                        kDelegationCodespace, "delegation is not active");
    }
    return spend(context, *state, amount);
  });
}

bool delegation_registry::is_valid_for_selector(
    const aegis::schema::delegation_id_t& id,
    const aegis::schema::selector_t& selector,
    const aegis::schema::timestamp_milliseconds_t now) const {
  auto state = load(id);
  if (!state.has_value() ||
      effective_status(*state, now) !=
          aegis::schema::delegation_status_t::active) {
    return false;
  }
  return selector_allowed(*state, selector);
}

bool delegation_registry::has_delegation(
    const aegis::schema::account_id_t& delegator,
    const aegis::schema::signer_id_t& delegatee,
    const aegis::schema::timestamp_milliseconds_t now) const {
  return has_delegation_of_type(delegator, delegatee,
                                {aegis::schema::delegation_type_t::full,
                                 aegis::schema::delegation_type_t::executor,
                                 aegis::schema::delegation_type_t::validator,
                                 aegis::schema::delegation_type_t::limited},
                                now);
}

bool delegation_registry::has_delegation_of_type(
    const aegis::schema::account_id_t& delegator,
    const aegis::schema::signer_id_t& delegatee,
    std::initializer_list<aegis::schema::delegation_type_t> types,
    const aegis::schema::timestamp_milliseconds_t now) const {
  for (const auto& id : index_of(delegator)) {
    auto state = load(id);
    if (!state.has_value() || state->delegatee != delegatee ||
        effective_status(*state, now) !=
            aegis::schema::delegation_status_t::active) {
      continue;
    }
    if (std::find(std::begin(types), std::end(types), state->type) !=
        std::end(types)) {
      return true;
    }
  }
  return false;
}

std::optional<aegis::schema::delegation_state_t>
delegation_registry::get_delegation(
    const aegis::schema::delegation_id_t& id,
    const aegis::schema::timestamp_milliseconds_t now) const {
  auto state = load(id);
  if (state.has_value()) {
    state->status = effective_status(*state, now);
  }
  return state;
}

std::vector<aegis::schema::delegation_state_t>
delegation_registry::list_delegations(
    const aegis::schema::account_id_t& delegator,
    const aegis::schema::timestamp_milliseconds_t now) const {
  auto out = std::vector<aegis::schema::delegation_state_t>{};
  for (const auto& id : index_of(delegator)) {
    auto state = get_delegation(id, now);
    if (state.has_value()) {
      out.push_back(std::move(*state));
    }
  }
  return out;
}

uint64_t delegation_registry::nonce_of(
    const aegis::schema::account_id_t& delegator) const {
  return store_
      .get<uint64_t>(aegis::schema::key::make_delegation_nonce_key(
          store_.encoder(), delegator))
      .value_or(0);
}

aegis::schema::hash32_t delegation_registry::signing_digest(
    const aegis::schema::account_id_t& delegator,
    const aegis::schema::delegation_params_t& params,
    const uint64_t nonce) const {
  auto material = store_.encoder().encode(std::tuple{
      std::string_view{"AEGIS_DELEGATION_AUTH_V1"}, delegator, params, nonce});
  return aegis::blake3::hash(
      aegis::schema::bytes_view_t{material.data(), material.size()});
}

result<aegis::schema::delegation_id_t> delegation_registry::create(
    const call_context_t& context,
    const aegis::schema::account_id_t& delegator,
    const aegis::schema::delegation_params_t& params) {
  auto& encoder = store_.encoder();
  if (aegis::schema::is_null(params.delegatee) ||
      params.delegatee == aegis::schema::make_account_signer(delegator)) {
    return make_error<aegis::schema::delegation_id_t>(
        aegis::schema::error_code_t::invalid_delegatee, kDelegationCodespace,
        "delegatee must be a non-null identity other than the delegator");
  }
  if (params.duration < kMinDelegationDuration ||
      params.duration > kMaxDelegationDuration) {
    return make_error<aegis::schema::delegation_id_t>(
        aegis::schema::error_code_t::invalid_duration, kDelegationCodespace,
        "duration must be between one hour and 365 days");
  }
  auto is_limited = params.type == aegis::schema::delegation_type_t::limited;
  if (is_limited == params.allowed_selectors.empty()) {
    return make_error<aegis::schema::delegation_id_t>(
        aegis::schema::error_code_t::invalid_config, kDelegationCodespace,
        "selectors are required for limited delegations and only for them");
  }

  auto sequence = store_.next_sequence(
      aegis::schema::key::make_delegation_sequence_key(encoder), false);
  auto material = encoder.encode(
      std::tuple{std::string_view{"AEGIS_DELEGATION_V1"}, delegator,
                 params.delegatee, context.now, sequence});
  auto id = aegis::blake3::hash(
      aegis::schema::bytes_view_t{material.data(), material.size()});
  auto key = aegis::schema::key::make_delegation_key(encoder, id);
  if (store_.get_raw(key).has_value()) {
    return make_error<aegis::schema::delegation_id_t>(
        aegis::schema::error_code_t::delegation_already_exists,
        kDelegationCodespace, "delegation id collision");
  }

  auto state = aegis::schema::delegation_state_t{
      .delegation_id = id,
      .delegator = delegator,
      .delegatee = params.delegatee,
      .type = params.type,
      .status = aegis::schema::delegation_status_t::active,
      .start_time = context.now,
      .end_time = context.now + params.duration,
      .spending_limit = params.spending_limit,
      .spent_amount = 0,
      .allowed_selectors = params.allowed_selectors};
  store_.put(key, state);

  auto index = index_of(delegator);
  index.push_back(id);
  store_.put(aegis::schema::key::make_delegator_index_key(encoder, delegator),
             index);

  spdlog::info("Created {} delegation {} from account {} to {}",
               aegis::schema::to_string(state.type),
               aegis::schema::to_log_string(id),
               aegis::schema::to_log_string(delegator),
               aegis::schema::to_log_string(state.delegatee));
  record(aegis::schema::account_event_type_t::delegation_created, state,
         context.now);
  return make_ok(id);
}

status_t delegation_registry::spend(const call_context_t& context,
                                    aegis::schema::delegation_state_t& state,
                                    const aegis::schema::amount_t& amount) {
  auto key = aegis::schema::key::make_delegation_key(store_.encoder(),
                                                     state.delegation_id);
  if (context.now > state.end_time) {
    state.status = aegis::schema::delegation_status_t::expired;
    store_.put_durable(key, state);
    record(aegis::schema::account_event_type_t::delegation_expired, state,
           context.now, true);
    return make_error(aegis::schema::error_code_t::delegation_expired,
                      kDelegationCodespace, "delegation has expired");
  }
  if (state.spending_limit > 0) {
    // Compare against the allowance so spent + amount is never formed.
    auto remaining = state.spending_limit > state.spent_amount
                         ? state.spending_limit - state.spent_amount
                         : aegis::schema::amount_t{0};
    if (amount > remaining) {
      auto rejected = make_error(
          aegis::schema::error_code_t::spending_limit_exceeded,
          kDelegationCodespace, "delegation spending limit exceeded");
      rejected.violation = spending_violation_t{
          .asset = aegis::schema::kNativeAsset,
          .amount = amount,
          .remaining = remaining};
      return rejected;
    }
  }
  state.spent_amount += amount;
  store_.put(key, state);
  record(aegis::schema::account_event_type_t::delegation_used, state,
         context.now);
  return make_ok();
}

std::optional<aegis::schema::delegation_state_t> delegation_registry::load(
    const aegis::schema::delegation_id_t& id) const {
  return store_.get<aegis::schema::delegation_state_t>(
      aegis::schema::key::make_delegation_key(store_.encoder(), id));
}

std::vector<aegis::schema::delegation_id_t> delegation_registry::index_of(
    const aegis::schema::account_id_t& delegator) const {
  return store_
      .get<std::vector<aegis::schema::delegation_id_t>>(
          aegis::schema::key::make_delegator_index_key(store_.encoder(),
                                                       delegator))
      .value_or(std::vector<aegis::schema::delegation_id_t>{});
}

void delegation_registry::record(
    const aegis::schema::account_event_type_t type,
    const aegis::schema::delegation_state_t& state,
    const aegis::schema::timestamp_milliseconds_t now,
    const bool durable) {
  store_.append_event(
      aegis::schema::account_event_record_t{.type = type,
                                            .account_id = state.delegator,
                                            .subject = state.delegation_id,
                                            .recorded_at = now},
      durable);
}

}  // namespace aegis::execution
