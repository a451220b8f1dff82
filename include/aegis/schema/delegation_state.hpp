#pragma once

#include <aegis/schema/delegation_status.hpp>
#include <aegis/schema/delegation_type.hpp>
#include <aegis/schema/primitives.hpp>
#include <vector>

// Schema type: delegation state.
// Persisted grant from a delegator account to a delegatee identity, with its
// validity window and spend accounting.
namespace aegis::schema {

template <uint16_t Version>
struct delegation_state;

template <>
struct delegation_state<1> final {
  uint16_t version{1};
  delegation_id_t delegation_id{};
  account_id_t delegator{};
  signer_id_t delegatee;
  delegation_type_t type{delegation_type_t::full};
  delegation_status_t status{delegation_status_t::inactive};
  timestamp_milliseconds_t start_time{};
  timestamp_milliseconds_t end_time{};
  amount_t spending_limit{};
  amount_t spent_amount{};
  std::vector<selector_t> allowed_selectors;
};

using delegation_state_t = delegation_state<1>;

}  // namespace aegis::schema
