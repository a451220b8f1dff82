#pragma once

#include <aegis/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: module type.
// Capability tag of a pluggable account module.
namespace aegis::schema {

enum class module_type_t : uint8_t {
  validator = 1,
  executor = 2,
  hook = 3,
};

inline constexpr auto kModuleTypeMappings = std::array{
    std::pair<std::string_view, module_type_t>{"validator",
                                               module_type_t::validator},
    std::pair<std::string_view, module_type_t>{"executor",
                                               module_type_t::executor},
    std::pair<std::string_view, module_type_t>{"hook", module_type_t::hook}};

template <>
inline std::optional<module_type_t> try_from_string<module_type_t>(
    const std::string_view value) {
  return from_string(value, kModuleTypeMappings);
}

inline constexpr std::string_view to_string(const module_type_t value) {
  return to_string(value, kModuleTypeMappings).value_or("unknown");
}

}  // namespace aegis::schema
