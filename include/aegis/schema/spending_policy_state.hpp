#pragma once

#include <aegis/schema/primitives.hpp>
#include <vector>

// Schema type: spending policy state.
// Account-wide settings of the spending limit hook.
namespace aegis::schema {

template <uint16_t Version>
struct spending_policy_state;

template <>
struct spending_policy_state<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  bool paused{};
  std::vector<signer_id_t> whitelist;
  std::vector<asset_id_t> limited_assets;
};

using spending_policy_state_t = spending_policy_state<1>;

}  // namespace aegis::schema
