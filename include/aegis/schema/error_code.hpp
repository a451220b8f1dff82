#pragma once

#include <aegis/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error code.
// Stable, machine-checkable rejection reasons of every account operation.
namespace aegis::schema {

enum class error_code_t : uint32_t {
  ok = 0,
  // Authorization
  unauthorized = 1,
  invalid_validator = 2,
  module_state_error = 3,
  threshold_not_met = 4,
  invalid_signature = 5,
  reentrant_call = 6,
  // Temporal
  delegation_expired = 10,
  recovery_delay_not_passed = 11,
  // Quota
  spending_limit_exceeded = 20,
  account_is_paused = 21,
  // Configuration
  invalid_config = 30,
  invalid_duration = 31,
  invalid_delegatee = 32,
  invalid_nonce = 33,
  // State consistency
  delegation_already_exists = 40,
  recovery_already_initiated = 41,
  already_approved = 42,
  delegation_not_found = 43,
  delegation_not_active = 44,
  recovery_not_initiated = 45,
  account_exists = 46,
  account_not_found = 47,
  // Effect
  execution_failed = 50,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code_t>{"ok", error_code_t::ok},
    std::pair<std::string_view, error_code_t>{"unauthorized",
                                              error_code_t::unauthorized},
    std::pair<std::string_view, error_code_t>{"invalid_validator",
                                              error_code_t::invalid_validator},
    std::pair<std::string_view, error_code_t>{
        "module_state_error", error_code_t::module_state_error},
    std::pair<std::string_view, error_code_t>{"threshold_not_met",
                                              error_code_t::threshold_not_met},
    std::pair<std::string_view, error_code_t>{"invalid_signature",
                                              error_code_t::invalid_signature},
    std::pair<std::string_view, error_code_t>{"reentrant_call",
                                              error_code_t::reentrant_call},
    std::pair<std::string_view, error_code_t>{
        "delegation_expired", error_code_t::delegation_expired},
    std::pair<std::string_view, error_code_t>{
        "recovery_delay_not_passed", error_code_t::recovery_delay_not_passed},
    std::pair<std::string_view, error_code_t>{
        "spending_limit_exceeded", error_code_t::spending_limit_exceeded},
    std::pair<std::string_view, error_code_t>{"account_is_paused",
                                              error_code_t::account_is_paused},
    std::pair<std::string_view, error_code_t>{"invalid_config",
                                              error_code_t::invalid_config},
    std::pair<std::string_view, error_code_t>{"invalid_duration",
                                              error_code_t::invalid_duration},
    std::pair<std::string_view, error_code_t>{"invalid_delegatee",
                                              error_code_t::invalid_delegatee},
    std::pair<std::string_view, error_code_t>{"invalid_nonce",
                                              error_code_t::invalid_nonce},
    std::pair<std::string_view, error_code_t>{
        "delegation_already_exists", error_code_t::delegation_already_exists},
    std::pair<std::string_view, error_code_t>{
        "recovery_already_initiated", error_code_t::recovery_already_initiated},
    std::pair<std::string_view, error_code_t>{"already_approved",
                                              error_code_t::already_approved},
    std::pair<std::string_view, error_code_t>{
        "delegation_not_found", error_code_t::delegation_not_found},
    std::pair<std::string_view, error_code_t>{
        "delegation_not_active", error_code_t::delegation_not_active},
    std::pair<std::string_view, error_code_t>{
        "recovery_not_initiated", error_code_t::recovery_not_initiated},
    std::pair<std::string_view, error_code_t>{"account_exists",
                                              error_code_t::account_exists},
    std::pair<std::string_view, error_code_t>{"account_not_found",
                                              error_code_t::account_not_found},
    std::pair<std::string_view, error_code_t>{"execution_failed",
                                              error_code_t::execution_failed}};

template <>
inline std::optional<error_code_t> try_from_string<error_code_t>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code_t value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace aegis::schema
