#pragma once

#include <aegis/execution/module.hpp>
#include <map>
#include <memory>
#include <optional>

namespace aegis::execution {

/// In-process module implementations an account may install, keyed by
/// module identifier.
class module_registry final {
 public:
  /// Register a module; a second registration under the same id replaces the
  /// first.
  void add(module_handle_t handle);

  std::optional<module_handle_t> find(
      const aegis::schema::module_id_t& module_id) const;

  std::shared_ptr<validator_module> find_validator(
      const aegis::schema::module_id_t& module_id) const;
  std::shared_ptr<executor_module> find_executor(
      const aegis::schema::module_id_t& module_id) const;
  std::shared_ptr<hook_module> find_hook(
      const aegis::schema::module_id_t& module_id) const;

 private:
  template <typename Interface>
  std::shared_ptr<Interface> find_as(
      const aegis::schema::module_id_t& module_id) const;

  std::map<aegis::schema::module_id_t, module_handle_t> modules_;
};

}  // namespace aegis::execution
