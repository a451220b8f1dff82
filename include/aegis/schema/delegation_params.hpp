#pragma once

#include <aegis/schema/delegation_type.hpp>
#include <aegis/schema/primitives.hpp>
#include <vector>

// Schema type: delegation params.
// Request to grant a delegatee scoped authority over the delegator account
// for `duration` milliseconds.
namespace aegis::schema {

template <uint16_t Version>
struct delegation_params;

template <>
struct delegation_params<1> final {
  uint16_t version{1};
  signer_id_t delegatee;
  delegation_type_t type{delegation_type_t::full};
  duration_milliseconds_t duration{};
  // Zero means unlimited.
  amount_t spending_limit{};
  std::vector<selector_t> allowed_selectors;
};

using delegation_params_t = delegation_params<1>;

}  // namespace aegis::schema
