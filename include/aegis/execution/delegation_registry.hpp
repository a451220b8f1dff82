#pragma once

#include <aegis/execution/module.hpp>
#include <aegis/execution/signature_verifier.hpp>
#include <aegis/execution/state_store.hpp>
#include <aegis/schema/delegation_params.hpp>
#include <aegis/schema/delegation_state.hpp>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>

namespace aegis::execution {

inline constexpr std::string_view kDelegationCodespace{"aegis.delegation"};

inline constexpr aegis::schema::duration_milliseconds_t
    kMinDelegationDuration = 60ull * 60 * 1000;
inline constexpr aegis::schema::duration_milliseconds_t
    kMaxDelegationDuration = 365ull * 24 * 60 * 60 * 1000;

/// Status of a delegation as seen at `now`. An active delegation past its end
/// time reads as expired; stored state is not touched.
aegis::schema::delegation_status_t effective_status(
    const aegis::schema::delegation_state_t& state,
    aegis::schema::timestamp_milliseconds_t now);

/// Time-bound, capability-scoped grants of authority from an account to
/// another identity (session keys).
///
/// Installed on an account as a validator, it authorizes entry point
/// operations signed by a delegatee and charges their value against the
/// delegation's spending limit.
class delegation_registry final : public validator_module {
 public:
  /// `admin` may revoke any delegation; a null identity disables that.
  delegation_registry(state_store& store, aegis::schema::signer_id_t admin);

  static aegis::schema::module_id_t module_id();

  void set_signature_verifier(signature_verifier_t verifier);

  const aegis::schema::module_id_t& id() const override;
  bool is_module_type(aegis::schema::module_type_t type) const override;
  status_t on_install(const call_context_t& context,
                      const aegis::schema::account_id_t& account,
                      const aegis::schema::bytes_view_t& init_data) override;
  /// Revokes every active delegation the account issued.
  status_t on_uninstall(
      const call_context_t& context,
      const aegis::schema::account_id_t& account,
      const aegis::schema::bytes_view_t& deinit_data) override;

  /// `validation_data` carries the SCALE encoded delegation id.
  status_t validate_operation(
      const call_context_t& context,
      const aegis::schema::operation_t& operation) override;
  status_t is_valid_signature(
      const aegis::schema::account_id_t& account,
      const aegis::schema::hash32_t& hash,
      const aegis::schema::signer_id_t& signer,
      const aegis::schema::signature_t& signature,
      aegis::schema::timestamp_milliseconds_t now) override;

  /// Caller must be the delegator account or its root authority.
  result<aegis::schema::delegation_id_t> create_delegation(
      const call_context_t& context,
      const aegis::schema::account_id_t& delegator,
      const aegis::schema::delegation_params_t& params);

  /// Create on behalf of the delegator with a signature by its root
  /// authority over signing_digest(delegator, params, nonce). Any caller may
  /// relay it.
  result<aegis::schema::delegation_id_t> create_delegation_with_signature(
      const call_context_t& context,
      const aegis::schema::account_id_t& delegator,
      const aegis::schema::delegation_params_t& params,
      uint64_t nonce,
      const aegis::schema::signature_t& signature);

  status_t revoke_delegation(const call_context_t& context,
                             const aegis::schema::delegation_id_t& id);

  /// Record `amount` against the delegation. Callable by the delegatee only.
  status_t use_delegation(const call_context_t& context,
                          const aegis::schema::delegation_id_t& id,
                          const aegis::schema::amount_t& amount);

  bool is_valid_for_selector(const aegis::schema::delegation_id_t& id,
                             const aegis::schema::selector_t& selector,
                             aegis::schema::timestamp_milliseconds_t now) const;
  bool has_delegation(const aegis::schema::account_id_t& delegator,
                      const aegis::schema::signer_id_t& delegatee,
                      aegis::schema::timestamp_milliseconds_t now) const;
  bool has_delegation_of_type(
      const aegis::schema::account_id_t& delegator,
      const aegis::schema::signer_id_t& delegatee,
      std::initializer_list<aegis::schema::delegation_type_t> types,
      aegis::schema::timestamp_milliseconds_t now) const;

  /// Stored delegation with its effective status at `now`.
  std::optional<aegis::schema::delegation_state_t> get_delegation(
      const aegis::schema::delegation_id_t& id,
      aegis::schema::timestamp_milliseconds_t now) const;
  std::vector<aegis::schema::delegation_state_t> list_delegations(
      const aegis::schema::account_id_t& delegator,
      aegis::schema::timestamp_milliseconds_t now) const;
  uint64_t nonce_of(const aegis::schema::account_id_t& delegator) const;

  /// Message the delegator's root authority signs to authorize a delegation.
  aegis::schema::hash32_t signing_digest(
      const aegis::schema::account_id_t& delegator,
      const aegis::schema::delegation_params_t& params,
      uint64_t nonce) const;

 private:
  result<aegis::schema::delegation_id_t> create(
      const call_context_t& context,
      const aegis::schema::account_id_t& delegator,
      const aegis::schema::delegation_params_t& params);
  /// Expiry and limit checks shared by use_delegation and
  /// validate_operation. Expiry is persisted even though the call fails.
  status_t spend(const call_context_t& context,
                 aegis::schema::delegation_state_t& state,
                 const aegis::schema::amount_t& amount);
  std::optional<aegis::schema::delegation_state_t> load(
      const aegis::schema::delegation_id_t& id) const;
  std::vector<aegis::schema::delegation_id_t> index_of(
      const aegis::schema::account_id_t& delegator) const;
  void record(aegis::schema::account_event_type_t type,
              const aegis::schema::delegation_state_t& state,
              aegis::schema::timestamp_milliseconds_t now,
              bool durable = false);

  state_store& store_;
  aegis::schema::signer_id_t admin_;
  signature_verifier_t signature_verifier_;
  aegis::schema::module_id_t module_id_;
};

}  // namespace aegis::execution
