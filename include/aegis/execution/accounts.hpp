#pragma once

#include <aegis/execution/state_store.hpp>
#include <aegis/schema/account_state.hpp>
#include <aegis/schema/primitives.hpp>
#include <optional>

namespace aegis::execution {

/// Fixed inactivity window after which the emergency identity may act.
inline constexpr aegis::schema::duration_milliseconds_t kEmergencyDelay =
    30ull * 24 * 60 * 60 * 1000;

/// Deterministic account identifier for a root authority and salt.
aegis::schema::account_id_t make_account_id(
    encoder_t& encoder,
    const aegis::schema::signer_id_t& root_authority,
    const aegis::schema::hash32_t& salt);

std::optional<aegis::schema::account_state_t> load_account(
    const state_store& store,
    const aegis::schema::account_id_t& account_id);

void save_account(state_store& store,
                  const aegis::schema::account_state_t& account);

/// True for the account's root authority and for the account acting on
/// itself.
bool is_account_controller(const aegis::schema::account_state_t& account,
                           const aegis::schema::signer_id_t& caller);

bool has_installed_module(const aegis::schema::account_state_t& account,
                          aegis::schema::module_type_t type,
                          const aegis::schema::module_id_t& module_id);

}  // namespace aegis::execution
