#pragma once

#include <aegis/schema/installed_module.hpp>
#include <aegis/schema/primitives.hpp>
#include <vector>

// Schema type: account state.
// Root authority, activity clock, emergency identity and installed modules of
// one smart account.
namespace aegis::schema {

template <uint16_t Version>
struct account_state;

template <>
struct account_state<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  signer_id_t root_authority;
  // Null when the emergency escape is disabled. Never changes after creation.
  signer_id_t emergency_identity;
  hash32_t salt{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t last_activity_at{};
  // Install order is preserved; hooks run in this order.
  std::vector<installed_module_t> installed_modules;
};

using account_state_t = account_state<1>;

}  // namespace aegis::schema
