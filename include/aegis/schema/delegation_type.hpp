#pragma once

#include <aegis/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: delegation type.
// Capability scope granted to a delegatee: full control, execution only,
// signature validation only, or a fixed list of selectors.
namespace aegis::schema {

enum class delegation_type_t : uint8_t {
  full = 0,
  executor = 1,
  validator = 2,
  limited = 3,
};

inline constexpr auto kDelegationTypeMappings = std::array{
    std::pair<std::string_view, delegation_type_t>{"full",
                                                   delegation_type_t::full},
    std::pair<std::string_view, delegation_type_t>{
        "executor", delegation_type_t::executor},
    std::pair<std::string_view, delegation_type_t>{
        "validator", delegation_type_t::validator},
    std::pair<std::string_view, delegation_type_t>{
        "limited", delegation_type_t::limited}};

template <>
inline std::optional<delegation_type_t> try_from_string<delegation_type_t>(
    const std::string_view value) {
  return from_string(value, kDelegationTypeMappings);
}

inline constexpr std::string_view to_string(const delegation_type_t value) {
  return to_string(value, kDelegationTypeMappings).value_or("unknown");
}

}  // namespace aegis::schema
