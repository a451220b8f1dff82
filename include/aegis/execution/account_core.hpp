#pragma once

#include <aegis/execution/call_context.hpp>
#include <aegis/execution/module_registry.hpp>
#include <aegis/execution/result.hpp>
#include <aegis/execution/state_store.hpp>
#include <aegis/execution/validation_manager.hpp>
#include <aegis/schema/account_state.hpp>
#include <aegis/schema/installed_module.hpp>
#include <aegis/schema/operation.hpp>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

namespace aegis::execution {

inline constexpr std::string_view kAccountCodespace{"aegis.account"};

/// Single entry point for state-mutating operations on an account.
///
/// Exactly one of the root authority, the account itself or the configured
/// entry point (through the validation manager) must grant a request before
/// its effect runs. Installed hooks gate every executed operation, and every
/// successful authorized call refreshes the account's activity time.
class account_core final {
 public:
  account_core(state_store& store,
               module_registry& modules,
               validation_manager& validation,
               aegis::schema::signer_id_t entry_point);

  /// The target runs while the state store lock is held. It may call back
  /// into the engine on the same thread but must not wait on another thread
  /// that does.
  void set_call_target(call_target_t target);

  aegis::schema::account_id_t compute_address(
      const aegis::schema::signer_id_t& root_authority,
      const aegis::schema::hash32_t& salt) const;

  /// A null emergency identity disables the emergency escape.
  result<aegis::schema::account_id_t> create_account(
      const call_context_t& context,
      const aegis::schema::signer_id_t& root_authority,
      const aegis::schema::signer_id_t& emergency_identity,
      const aegis::schema::hash32_t& salt);

  result<aegis::schema::bytes_t> execute(
      const call_context_t& context,
      const aegis::schema::operation_t& operation);

  /// Execute on behalf of an installed executor module. The caller is the
  /// executor's module identity.
  result<aegis::schema::bytes_t> execute_from_executor(
      const call_context_t& context,
      const aegis::schema::operation_t& operation);

  status_t install_module(const call_context_t& context,
                          const aegis::schema::account_id_t& account,
                          aegis::schema::module_type_t type,
                          const aegis::schema::module_id_t& module_id,
                          const aegis::schema::bytes_view_t& init_data);
  status_t uninstall_module(const call_context_t& context,
                            const aegis::schema::account_id_t& account,
                            aegis::schema::module_type_t type,
                            const aegis::schema::module_id_t& module_id,
                            const aegis::schema::bytes_view_t& deinit_data);

  status_t set_root_authority(const call_context_t& context,
                              const aegis::schema::account_id_t& account,
                              const aegis::schema::signer_id_t& new_root);

  /// Recovery path for installed validator modules; the caller is the
  /// module's identity.
  status_t recover_root_authority(const call_context_t& context,
                                  const aegis::schema::account_id_t& account,
                                  const aegis::schema::signer_id_t& new_root);

  /// Last resort reassignment by the emergency identity once the account has
  /// been inactive for longer than kEmergencyDelay.
  status_t emergency_recovery(const call_context_t& context,
                              const aegis::schema::account_id_t& account,
                              const aegis::schema::signer_id_t& new_root);

  std::optional<aegis::schema::account_state_t> get_account(
      const aegis::schema::account_id_t& account) const;
  bool is_module_installed(const aegis::schema::account_id_t& account,
                           aegis::schema::module_type_t type,
                           const aegis::schema::module_id_t& module_id) const;
  std::vector<aegis::schema::installed_module_t> installed_modules(
      const aegis::schema::account_id_t& account) const;

 private:
  /// Marks an account as having an operation in flight.
  class in_flight_guard final {
   public:
    in_flight_guard(std::set<aegis::schema::account_id_t>& accounts,
                    const aegis::schema::account_id_t& account);
    ~in_flight_guard();
    in_flight_guard(const in_flight_guard&) = delete;
    in_flight_guard& operator=(const in_flight_guard&) = delete;

    bool acquired() const;

   private:
    std::set<aegis::schema::account_id_t>& accounts_;
    aegis::schema::account_id_t account_;
    bool acquired_{false};
  };

  template <typename T, typename Fn>
  result<T> with_account(std::string_view operation,
                         const call_context_t& context,
                         const aegis::schema::account_id_t& account,
                         Fn&& fn);

  status_t authorize(const call_context_t& context,
                     const aegis::schema::account_state_t& account,
                     const aegis::schema::operation_t& operation);
  result<aegis::schema::bytes_t> run_with_hooks(
      const call_context_t& context,
      aegis::schema::account_state_t& account,
      const aegis::schema::operation_t& operation);
  status_t assign_root(const call_context_t& context,
                       aegis::schema::account_state_t& account,
                       const aegis::schema::signer_id_t& new_root,
                       aegis::schema::account_event_type_t event);
  void touch(aegis::schema::account_state_t& account,
             aegis::schema::timestamp_milliseconds_t now);
  void record(aegis::schema::account_event_type_t type,
              const aegis::schema::account_id_t& account,
              const std::optional<aegis::schema::hash32_t>& subject,
              aegis::schema::timestamp_milliseconds_t now);

  state_store& store_;
  module_registry& modules_;
  validation_manager& validation_;
  aegis::schema::signer_id_t entry_point_;
  call_target_t call_target_;
  std::set<aegis::schema::account_id_t> in_flight_;
};

}  // namespace aegis::execution
