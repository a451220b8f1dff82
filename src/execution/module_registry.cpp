#include <spdlog/spdlog.h>
#include <aegis/blake3/hash.hpp>
#include <aegis/execution/module_registry.hpp>

#include <iterator>

namespace aegis::execution {

aegis::schema::module_type_t handle_type(const module_handle_t& handle) {
  return std::visit(
      overloaded{[](const std::shared_ptr<validator_module>&) {
                   return aegis::schema::module_type_t::validator;
                 },
                 [](const std::shared_ptr<executor_module>&) {
                   return aegis::schema::module_type_t::executor;
                 },
                 [](const std::shared_ptr<hook_module>&) {
                   return aegis::schema::module_type_t::hook;
                 }},
      handle);
}

module& as_module(const module_handle_t& handle) {
  return std::visit([](const auto& value) -> module& { return *value; },
                    handle);
}

aegis::schema::module_id_t make_module_id(const std::string_view name) {
  return aegis::blake3::hash(name);
}

void module_registry::add(module_handle_t handle) {
  const auto& module_id = as_module(handle).id();
  spdlog::info("Registered {} module {}",
               aegis::schema::to_string(handle_type(handle)),
               aegis::schema::to_log_string(module_id));
  modules_.insert_or_assign(module_id, std::move(handle));
}

std::optional<module_handle_t> module_registry::find(
    const aegis::schema::module_id_t& module_id) const {
  auto it = modules_.find(module_id);
  if (it == std::end(modules_)) {
    return std::nullopt;
  }
  return it->second;
}

template <typename Interface>
std::shared_ptr<Interface> module_registry::find_as(
    const aegis::schema::module_id_t& module_id) const {
  auto it = modules_.find(module_id);
  if (it == std::end(modules_)) {
    return nullptr;
  }
  const auto* value = std::get_if<std::shared_ptr<Interface>>(&it->second);
  if (value == nullptr) {
    return nullptr;
  }
  return *value;
}

std::shared_ptr<validator_module> module_registry::find_validator(
    const aegis::schema::module_id_t& module_id) const {
  return find_as<validator_module>(module_id);
}

std::shared_ptr<executor_module> module_registry::find_executor(
    const aegis::schema::module_id_t& module_id) const {
  return find_as<executor_module>(module_id);
}

std::shared_ptr<hook_module> module_registry::find_hook(
    const aegis::schema::module_id_t& module_id) const {
  return find_as<hook_module>(module_id);
}

}  // namespace aegis::execution
