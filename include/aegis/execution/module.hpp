#pragma once

#include <aegis/execution/call_context.hpp>
#include <aegis/execution/result.hpp>
#include <aegis/schema/module_type.hpp>
#include <aegis/schema/operation.hpp>
#include <aegis/schema/primitives.hpp>
#include <memory>
#include <string_view>
#include <variant>

namespace aegis::execution {

/// Pluggable account module. Modules are shared by every account that
/// installs them and keep their per-account state in the state store.
class module {
 public:
  virtual ~module() = default;

  virtual const aegis::schema::module_id_t& id() const = 0;
  virtual bool is_module_type(aegis::schema::module_type_t type) const = 0;

  /// Called from install with the account as caller; a rejection aborts the
  /// install.
  virtual status_t on_install(const call_context_t& context,
                              const aegis::schema::account_id_t& account,
                              const aegis::schema::bytes_view_t& init_data) = 0;

  /// Called from uninstall with the account as caller; a rejection aborts the
  /// uninstall.
  virtual status_t on_uninstall(
      const call_context_t& context,
      const aegis::schema::account_id_t& account,
      const aegis::schema::bytes_view_t& deinit_data) = 0;
};

class validator_module : public module {
 public:
  /// Authorize an operation submitted through the entry point.
  virtual status_t validate_operation(
      const call_context_t& context,
      const aegis::schema::operation_t& operation) = 0;

  /// Accept or reject `signature` by `signer` over `hash` on behalf of
  /// `account`.
  virtual status_t is_valid_signature(
      const aegis::schema::account_id_t& account,
      const aegis::schema::hash32_t& hash,
      const aegis::schema::signer_id_t& signer,
      const aegis::schema::signature_t& signature,
      aegis::schema::timestamp_milliseconds_t now) = 0;
};

/// Executors drive the account through execute_from_executor.
class executor_module : public module {};

class hook_module : public module {
 public:
  /// Gate run before the effect. The returned token is handed back to
  /// post_check.
  virtual result<aegis::schema::bytes_t> pre_check(
      const call_context_t& context,
      const aegis::schema::operation_t& operation) = 0;

  virtual status_t post_check(const call_context_t& context,
                              const aegis::schema::operation_t& operation,
                              const aegis::schema::bytes_view_t& token) = 0;
};

using module_handle_t = std::variant<std::shared_ptr<validator_module>,
                                     std::shared_ptr<executor_module>,
                                     std::shared_ptr<hook_module>>;

/// Capability tag of the interface a handle holds.
aegis::schema::module_type_t handle_type(const module_handle_t& handle);

module& as_module(const module_handle_t& handle);

/// Stable module identifier derived from a module name.
aegis::schema::module_id_t make_module_id(std::string_view name);

}  // namespace aegis::execution
