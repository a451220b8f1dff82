#include <aegis/blake3/hash.hpp>
#include <aegis/execution/accounts.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>
#include <tuple>

namespace aegis::execution {

aegis::schema::account_id_t make_account_id(
    encoder_t& encoder,
    const aegis::schema::signer_id_t& root_authority,
    const aegis::schema::hash32_t& salt) {
  auto material = encoder.encode(
      std::tuple{std::string_view{"AEGIS_ACCOUNT_V1"}, root_authority, salt});
  return aegis::blake3::hash(
      aegis::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<aegis::schema::account_state_t> load_account(
    const state_store& store,
    const aegis::schema::account_id_t& account_id) {
  return store.get<aegis::schema::account_state_t>(
      aegis::schema::key::make_account_key(store.encoder(), account_id));
}

void save_account(state_store& store,
                  const aegis::schema::account_state_t& account) {
  store.put(
      aegis::schema::key::make_account_key(store.encoder(), account.account_id),
      account);
}

bool is_account_controller(const aegis::schema::account_state_t& account,
                           const aegis::schema::signer_id_t& caller) {
  return caller == account.root_authority ||
         caller == aegis::schema::make_account_signer(account.account_id);
}

bool has_installed_module(const aegis::schema::account_state_t& account,
                          const aegis::schema::module_type_t type,
                          const aegis::schema::module_id_t& module_id) {
  return std::find(std::begin(account.installed_modules),
                   std::end(account.installed_modules),
                   aegis::schema::installed_module_t{
                       .type = type, .module_id = module_id}) !=
         std::end(account.installed_modules);
}

}  // namespace aegis::execution
