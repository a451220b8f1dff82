#pragma once

#include <aegis/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: delegation status.
// Delegation lifecycle: active until revoked by the delegator or until its
// end time passes.
namespace aegis::schema {

enum class delegation_status_t : uint8_t {
  inactive = 0,
  active = 1,
  revoked = 2,
  expired = 3,
};

inline constexpr auto kDelegationStatusMappings = std::array{
    std::pair<std::string_view, delegation_status_t>{
        "inactive", delegation_status_t::inactive},
    std::pair<std::string_view, delegation_status_t>{
        "active", delegation_status_t::active},
    std::pair<std::string_view, delegation_status_t>{
        "revoked", delegation_status_t::revoked},
    std::pair<std::string_view, delegation_status_t>{
        "expired", delegation_status_t::expired}};

template <>
inline std::optional<delegation_status_t> try_from_string<delegation_status_t>(
    const std::string_view value) {
  return from_string(value, kDelegationStatusMappings);
}

inline constexpr std::string_view to_string(const delegation_status_t value) {
  return to_string(value, kDelegationStatusMappings).value_or("unknown");
}

}  // namespace aegis::schema
