#pragma once

#include <aegis/execution/account_core.hpp>
#include <aegis/execution/call_context.hpp>
#include <aegis/execution/delegation_registry.hpp>
#include <aegis/execution/guardian_recovery_validator.hpp>
#include <aegis/execution/module_registry.hpp>
#include <aegis/execution/signature_verifier.hpp>
#include <aegis/execution/spending_limit_hook.hpp>
#include <aegis/execution/state_store.hpp>
#include <aegis/execution/validation_manager.hpp>
#include <aegis/schema/account_event_record.hpp>
#include <aegis/schema/primitives.hpp>
#include <aegis/schema/query_result.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace aegis::execution {

/// Upper bound on the number of events one range query returns.
inline constexpr uint64_t kMaxEventRange = 1000;

struct engine_config_t final {
  std::string db_path;
  /// Outer dispatcher identity; its submissions are authorized through the
  /// validation manager.
  aegis::schema::signer_id_t entry_point;
  /// May revoke any delegation. Null disables it.
  aegis::schema::signer_id_t registry_admin;
};

/// Account authorization and recovery engine over one RocksDB database.
///
/// Owns storage and the components, and registers the built-in modules
/// (delegation registry, guardian recovery, spending limit hook).
class engine final {
 public:
  explicit engine(engine_config_t config);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Replace the signature check used by the root validator and by signed
  /// delegation creation.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Replace the effect invoker of executed operations. The invoker runs
  /// under the state store lock, see account_core::set_call_target.
  void set_call_target(call_target_t target);

  account_core& accounts();
  validation_manager& validation();
  delegation_registry& delegations();
  guardian_recovery_validator& guardians();
  spending_limit_hook& spending();
  module_registry& modules();

  /// Read-only query by route. Keys and values are SCALE encoded.
  ///
  /// /account                  key account_id
  /// /delegation               key tuple{delegation_id, now}
  /// /delegations/by_delegator key tuple{account_id, now}
  /// /guardian/config          key account_id
  /// /guardian/request         key account_id
  /// /spending/limit           key tuple{account_id, asset_id, now}
  /// /events/range             key tuple{from_id, to_id}, inclusive
  aegis::schema::query_result_t query(std::string_view path,
                                      const aegis::schema::bytes_view_t& key);

  /// Committed events with ids in [from, to], at most kMaxEventRange.
  std::vector<aegis::schema::account_event_record_t> events(uint64_t from,
                                                            uint64_t to) const;

  /// Committed entry count per engine keyspace.
  std::vector<std::pair<std::string_view, std::size_t>> keyspace_sizes() const;

 private:
  engine_config_t config_;
  encoder_t encoder_;
  storage_t storage_;
  state_store store_;
  module_registry modules_;
  std::shared_ptr<delegation_registry> delegations_;
  std::shared_ptr<spending_limit_hook> spending_;
  validation_manager validation_;
  account_core accounts_;
  std::shared_ptr<guardian_recovery_validator> guardians_;
};

}  // namespace aegis::execution
