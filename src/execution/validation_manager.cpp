#include <spdlog/spdlog.h>
#include <aegis/crypto/verify.hpp>
#include <aegis/execution/accounts.hpp>
#include <aegis/execution/validation_manager.hpp>

namespace aegis::execution {

validation_manager::validation_manager(state_store& store,
                                       module_registry& modules,
                                       delegation_registry& delegations)
    : store_{store},
      modules_{modules},
      delegations_{delegations},
      signature_verifier_{aegis::crypto::verify_signature} {}

void validation_manager::set_signature_verifier(
    signature_verifier_t verifier) {
  signature_verifier_ = std::move(verifier);
}

status_t validation_manager::validate(
    const call_context_t& context,
    const aegis::schema::account_state_t& account,
    const aegis::schema::operation_t& operation) {
  if (aegis::schema::is_zero(operation.validation_id)) {
    if (operation.signer != account.root_authority) {
      return make_error(aegis::schema::error_code_t::unauthorized,
                        kValidationCodespace,
                        "signer is not the root authority");
    }
    return make_ok();
  }
  auto validator = resolve(account, operation.validation_id);
  if (!validator) {
    return make_error(aegis::schema::error_code_t::invalid_validator,
                      kValidationCodespace,
                      "validation id is not an installed validator");
  }
  spdlog::debug("Dispatching operation on account {} to validator {}",
                aegis::schema::to_log_string(account.account_id),
                aegis::schema::to_log_string(operation.validation_id));
  return validator->validate_operation(context, operation);
}

status_t validation_manager::is_valid_signature(
    const aegis::schema::account_id_t& account,
    const aegis::schema::hash32_t& hash,
    const aegis::schema::signer_id_t& signer,
    const aegis::schema::signature_t& signature,
    const aegis::schema::module_id_t& validation_id,
    const aegis::schema::timestamp_milliseconds_t now) {
  auto state = load_account(store_, account);
  if (!state.has_value()) {
    return make_error(aegis::schema::error_code_t::account_not_found,
                      kValidationCodespace, "account does not exist");
  }
  if (!aegis::schema::is_zero(validation_id)) {
    auto validator = resolve(*state, validation_id);
    if (!validator) {
      return make_error(aegis::schema::error_code_t::invalid_validator,
                        kValidationCodespace,
                        "validation id is not an installed validator");
    }
    return validator->is_valid_signature(account, hash, signer, signature,
                                         now);
  }

  auto entitled =
      signer == state->root_authority ||
      delegations_.has_delegation_of_type(
          account, signer,
          {aegis::schema::delegation_type_t::full,
           aegis::schema::delegation_type_t::executor},
          now);
  if (!entitled) {
    return make_error(aegis::schema::error_code_t::unauthorized,
                      kValidationCodespace,
                      "signer may not sign for the account");
  }
  if (!signature_verifier_(
          aegis::schema::bytes_view_t{hash.data(), hash.size()}, signer,
          signature)) {
    return make_error(aegis::schema::error_code_t::invalid_signature,
                      kValidationCodespace, "signature verification failed");
  }
  return make_ok();
}

std::shared_ptr<validator_module> validation_manager::resolve(
    const aegis::schema::account_state_t& account,
    const aegis::schema::module_id_t& validation_id) const {
  if (!has_installed_module(account, aegis::schema::module_type_t::validator,
                            validation_id)) {
    return nullptr;
  }
  return modules_.find_validator(validation_id);
}

}  // namespace aegis::execution
