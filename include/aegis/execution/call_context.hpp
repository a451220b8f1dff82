#pragma once

#include <aegis/schema/operation.hpp>
#include <aegis/schema/primitives.hpp>
#include <functional>

namespace aegis::execution {

/// Authenticated caller and clock reading of one engine call.
struct call_context_t final {
  aegis::schema::signer_id_t caller;
  aegis::schema::timestamp_milliseconds_t now{};
};

/// Outcome reported by the effect invoker for an authorized operation.
struct call_outcome_t final {
  bool success{true};
  aegis::schema::bytes_t return_data;
};

/// Performs the actual call of an operation against its target.
using call_target_t = std::function<call_outcome_t(
    const call_context_t& context,
    const aegis::schema::operation_t& operation)>;

}  // namespace aegis::execution
