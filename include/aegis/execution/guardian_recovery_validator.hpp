#pragma once

#include <aegis/execution/account_core.hpp>
#include <aegis/execution/module.hpp>
#include <aegis/execution/state_store.hpp>
#include <aegis/schema/guardian_config.hpp>
#include <aegis/schema/recovery_request.hpp>
#include <optional>
#include <string_view>

namespace aegis::execution {

inline constexpr std::string_view kGuardianCodespace{"aegis.guardian"};

inline constexpr uint32_t kMinGuardianThreshold = 2;

/// N-of-M guardian recovery of an account's root authority.
///
/// Per account: no request, then initiated (collecting approvals), then
/// executed or cancelled. Configuration arrives as install data
/// (guardian_config_init_t). As a validator it authorizes nothing else.
class guardian_recovery_validator final : public validator_module {
 public:
  guardian_recovery_validator(state_store& store, account_core& accounts);

  static aegis::schema::module_id_t module_id();

  const aegis::schema::module_id_t& id() const override;
  bool is_module_type(aegis::schema::module_type_t type) const override;
  status_t on_install(const call_context_t& context,
                      const aegis::schema::account_id_t& account,
                      const aegis::schema::bytes_view_t& init_data) override;
  /// Clears the configuration and any outstanding request.
  status_t on_uninstall(
      const call_context_t& context,
      const aegis::schema::account_id_t& account,
      const aegis::schema::bytes_view_t& deinit_data) override;
  status_t validate_operation(
      const call_context_t& context,
      const aegis::schema::operation_t& operation) override;
  status_t is_valid_signature(
      const aegis::schema::account_id_t& account,
      const aegis::schema::hash32_t& hash,
      const aegis::schema::signer_id_t& signer,
      const aegis::schema::signature_t& signature,
      aegis::schema::timestamp_milliseconds_t now) override;

  status_t initiate_recovery(const call_context_t& context,
                             const aegis::schema::account_id_t& account,
                             const aegis::schema::signer_id_t& new_root);
  status_t approve_recovery(const call_context_t& context,
                            const aegis::schema::account_id_t& account);
  /// Requires the recovery delay to have passed (checked first) and the
  /// approval threshold to be met.
  status_t execute_recovery(const call_context_t& context,
                            const aegis::schema::account_id_t& account);
  status_t cancel_recovery(const call_context_t& context,
                           const aegis::schema::account_id_t& account);

  status_t add_guardian(const call_context_t& context,
                        const aegis::schema::account_id_t& account,
                        const aegis::schema::signer_id_t& guardian);
  status_t remove_guardian(const call_context_t& context,
                           const aegis::schema::account_id_t& account,
                           const aegis::schema::signer_id_t& guardian);
  status_t update_threshold(const call_context_t& context,
                            const aegis::schema::account_id_t& account,
                            uint32_t threshold);
  status_t update_recovery_delay(
      const call_context_t& context,
      const aegis::schema::account_id_t& account,
      aegis::schema::duration_milliseconds_t recovery_delay);

  std::optional<aegis::schema::guardian_config_t> get_config(
      const aegis::schema::account_id_t& account) const;
  std::optional<aegis::schema::recovery_request_t> get_request(
      const aegis::schema::account_id_t& account) const;
  bool is_guardian(const aegis::schema::account_id_t& account,
                   const aegis::schema::signer_id_t& identity) const;

 private:
  template <typename Mutator>
  status_t update_config(std::string_view operation,
                         const call_context_t& context,
                         const aegis::schema::account_id_t& account,
                         Mutator&& mutate);
  status_t require_guardian(const call_context_t& context,
                            const aegis::schema::account_id_t& account) const;
  void record(aegis::schema::account_event_type_t type,
              const aegis::schema::account_id_t& account,
              aegis::schema::timestamp_milliseconds_t now);

  state_store& store_;
  account_core& accounts_;
  aegis::schema::module_id_t module_id_;
};

/// Threshold, guardian set and delay rules every stored config satisfies.
bool is_valid_guardian_config(const aegis::schema::guardian_config_t& config);

}  // namespace aegis::execution
