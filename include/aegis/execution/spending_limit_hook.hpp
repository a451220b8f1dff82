#pragma once

#include <aegis/execution/module.hpp>
#include <aegis/execution/state_store.hpp>
#include <aegis/schema/spending_limit_config.hpp>
#include <aegis/schema/spending_policy_state.hpp>
#include <optional>
#include <string_view>

namespace aegis::execution {

inline constexpr std::string_view kSpendingCodespace{"aegis.spending"};

/// Config as seen at `now`: an enabled config whose period has elapsed reads
/// as a fresh period starting at `now`. A single reset covers any number of
/// elapsed periods.
aegis::schema::spending_limit_config_t effective_spending_limit(
    const aegis::schema::spending_limit_config_t& config,
    aegis::schema::timestamp_milliseconds_t now);

/// Rolling-period quota per account and asset, enforced as a hook around
/// every executed operation.
///
/// A transfer payload moves its amount of the token at the operation target;
/// any other operation moves its value of the native asset.
class spending_limit_hook final : public hook_module {
 public:
  explicit spending_limit_hook(state_store& store);

  static aegis::schema::module_id_t module_id();

  const aegis::schema::module_id_t& id() const override;
  bool is_module_type(aegis::schema::module_type_t type) const override;
  /// `init_data` is empty or a SCALE vector of spending_limit_rule_t.
  status_t on_install(const call_context_t& context,
                      const aegis::schema::account_id_t& account,
                      const aegis::schema::bytes_view_t& init_data) override;
  status_t on_uninstall(
      const call_context_t& context,
      const aegis::schema::account_id_t& account,
      const aegis::schema::bytes_view_t& deinit_data) override;

  result<aegis::schema::bytes_t> pre_check(
      const call_context_t& context,
      const aegis::schema::operation_t& operation) override;
  status_t post_check(const call_context_t& context,
                      const aegis::schema::operation_t& operation,
                      const aegis::schema::bytes_view_t& token) override;

  /// Create or update the limit for an asset. Updating keeps what was already
  /// spent in the current period.
  status_t set_spending_limit(const call_context_t& context,
                              const aegis::schema::account_id_t& account,
                              const aegis::schema::asset_id_t& asset,
                              const aegis::schema::amount_t& limit,
                              aegis::schema::duration_milliseconds_t
                                  period_length);
  status_t remove_spending_limit(const call_context_t& context,
                                 const aegis::schema::account_id_t& account,
                                 const aegis::schema::asset_id_t& asset);
  /// Start a new period; does nothing while the current one is running.
  status_t reset_period(const call_context_t& context,
                        const aegis::schema::account_id_t& account,
                        const aegis::schema::asset_id_t& asset);
  status_t set_whitelisted(const call_context_t& context,
                           const aegis::schema::account_id_t& account,
                           const aegis::schema::signer_id_t& identity,
                           bool whitelisted);
  status_t set_paused(const call_context_t& context,
                      const aegis::schema::account_id_t& account,
                      bool paused);

  std::optional<aegis::schema::spending_limit_config_t> get_spending_limit(
      const aegis::schema::account_id_t& account,
      const aegis::schema::asset_id_t& asset,
      aegis::schema::timestamp_milliseconds_t now) const;
  /// Allowance left in the current period; std::nullopt when no limit is
  /// enabled for the asset.
  std::optional<aegis::schema::amount_t> remaining(
      const aegis::schema::account_id_t& account,
      const aegis::schema::asset_id_t& asset,
      aegis::schema::timestamp_milliseconds_t now) const;
  aegis::schema::spending_policy_state_t get_policy(
      const aegis::schema::account_id_t& account) const;

 private:
  status_t authorize_admin(const call_context_t& context,
                           const aegis::schema::account_id_t& account) const;
  status_t apply_limit(const call_context_t& context,
                       const aegis::schema::account_id_t& account,
                       const aegis::schema::asset_id_t& asset,
                       const aegis::schema::amount_t& limit,
                       aegis::schema::duration_milliseconds_t period_length);
  void save_policy(const aegis::schema::spending_policy_state_t& policy);
  void record(aegis::schema::account_event_type_t type,
              const aegis::schema::account_id_t& account,
              const aegis::schema::asset_id_t& asset,
              aegis::schema::timestamp_milliseconds_t now);

  state_store& store_;
  aegis::schema::module_id_t module_id_;
};

}  // namespace aegis::execution
