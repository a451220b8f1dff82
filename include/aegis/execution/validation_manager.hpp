#pragma once

#include <aegis/execution/call_context.hpp>
#include <aegis/execution/delegation_registry.hpp>
#include <aegis/execution/module_registry.hpp>
#include <aegis/execution/result.hpp>
#include <aegis/execution/signature_verifier.hpp>
#include <aegis/execution/state_store.hpp>
#include <aegis/schema/account_state.hpp>
#include <aegis/schema/operation.hpp>
#include <string_view>

namespace aegis::execution {

inline constexpr std::string_view kValidationCodespace{"aegis.validation"};

/// Resolves which validator authorizes an operation or a signature for an
/// account. Validation id zero is the root validator; any other id must name
/// a validator module installed on the account.
class validation_manager final {
 public:
  validation_manager(state_store& store,
                     module_registry& modules,
                     delegation_registry& delegations);

  void set_signature_verifier(signature_verifier_t verifier);

  /// Authorize an entry point submission on behalf of `operation.signer`.
  status_t validate(const call_context_t& context,
                    const aegis::schema::account_state_t& account,
                    const aegis::schema::operation_t& operation);

  /// Check a signature made on behalf of the account. The root validator
  /// also accepts holders of an active full or executor delegation.
  status_t is_valid_signature(const aegis::schema::account_id_t& account,
                              const aegis::schema::hash32_t& hash,
                              const aegis::schema::signer_id_t& signer,
                              const aegis::schema::signature_t& signature,
                              const aegis::schema::module_id_t& validation_id,
                              aegis::schema::timestamp_milliseconds_t now);

 private:
  std::shared_ptr<validator_module> resolve(
      const aegis::schema::account_state_t& account,
      const aegis::schema::module_id_t& validation_id) const;

  state_store& store_;
  module_registry& modules_;
  delegation_registry& delegations_;
  signature_verifier_t signature_verifier_;
};

}  // namespace aegis::execution
