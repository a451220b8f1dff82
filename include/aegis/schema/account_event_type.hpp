#pragma once

#include <cstdint>

// Schema type: account event type.
// Audit taxonomy of committed account transitions and denials.
namespace aegis::schema {

enum class account_event_type_t : uint16_t {
  account_created = 1,
  operation_executed = 2,
  module_installed = 3,
  module_uninstalled = 4,
  root_authority_changed = 5,
  emergency_recovery_executed = 6,
  delegation_created = 7,
  delegation_revoked = 8,
  delegation_used = 9,
  delegation_expired = 10,
  recovery_initiated = 11,
  recovery_approved = 12,
  recovery_executed = 13,
  recovery_cancelled = 14,
  guardian_config_updated = 15,
  spending_limit_updated = 16,
  spending_period_reset = 17,
  spending_policy_updated = 18,
  operation_denied = 19,
};

}  // namespace aegis::schema
