#include <spdlog/spdlog.h>
#include <aegis/execution/accounts.hpp>
#include <aegis/execution/spending_limit_hook.hpp>
#include <aegis/schema/transfer_call.hpp>

#include <algorithm>
#include <iterator>
#include <tuple>
#include <vector>

namespace aegis::execution {

namespace {

bool contains(const std::vector<aegis::schema::signer_id_t>& values,
              const aegis::schema::signer_id_t& value) {
  return std::find(std::begin(values), std::end(values), value) !=
         std::end(values);
}

aegis::schema::amount_t allowance(
    const aegis::schema::spending_limit_config_t& config) {
  if (config.spent >= config.limit) {
    return 0;
  }
  return config.limit - config.spent;
}

}  // namespace

aegis::schema::spending_limit_config_t effective_spending_limit(
    const aegis::schema::spending_limit_config_t& config,
    const aegis::schema::timestamp_milliseconds_t now) {
  auto effective = config;
  if (effective.enabled && now >= effective.period_start &&
      now - effective.period_start >= effective.period_length) {
    effective.spent = 0;
    effective.period_start = now;
  }
  return effective;
}

spending_limit_hook::spending_limit_hook(state_store& store)
    : store_{store}, module_id_{module_id()} {}

aegis::schema::module_id_t spending_limit_hook::module_id() {
  return make_module_id("aegis.module.spending_limit_hook");
}

const aegis::schema::module_id_t& spending_limit_hook::id() const {
  return module_id_;
}

bool spending_limit_hook::is_module_type(
    const aegis::schema::module_type_t type) const {
  return type == aegis::schema::module_type_t::hook;
}

status_t spending_limit_hook::on_install(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::bytes_view_t& init_data) {
  if (init_data.empty()) {
    return make_ok();
  }
  auto rules = store_.encoder()
                   .try_decode<std::vector<aegis::schema::spending_limit_rule_t>>(
                       init_data);
  if (!rules.has_value()) {
    return make_error(aegis::schema::error_code_t::invalid_config,
                      kSpendingCodespace, "malformed spending limit rules");
  }
  for (const auto& rule : *rules) {
    auto applied = apply_limit(context, account, rule.asset_id, rule.limit,
                               rule.period_length);
    if (!applied.ok()) {
      return applied;
    }
  }
  return make_ok();
}

status_t spending_limit_hook::on_uninstall(
    const call_context_t&,
    const aegis::schema::account_id_t& account,
    const aegis::schema::bytes_view_t&) {
  auto& encoder = store_.encoder();
  auto policy = get_policy(account);
  for (const auto& asset : policy.limited_assets) {
    store_.erase(
        aegis::schema::key::make_spending_limit_key(encoder, account, asset));
  }
  store_.erase(aegis::schema::key::make_spending_policy_key(encoder, account));
  return make_ok();
}

result<aegis::schema::bytes_t> spending_limit_hook::pre_check(
    const call_context_t& context,
    const aegis::schema::operation_t& operation) {
  auto& encoder = store_.encoder();
  auto asset = aegis::schema::kNativeAsset;
  auto amount = operation.value;
  auto transfer = aegis::schema::try_parse_transfer(encoder, operation);
  if (transfer.has_value()) {
    asset = operation.target;
    amount = transfer->amount;
  }

  auto policy = get_policy(operation.account);
  if (contains(policy.whitelist, context.caller) ||
      contains(policy.whitelist,
               aegis::schema::signer_id_t{
                   aegis::schema::named_signer_t{operation.target}})) {
    return make_ok(aegis::schema::bytes_t{});
  }
  if (policy.paused) {
    return make_error<aegis::schema::bytes_t>(
        aegis::schema::error_code_t::account_is_paused, kSpendingCodespace,
        "account spending is paused");
  }

  auto key = aegis::schema::key::make_spending_limit_key(
      encoder, operation.account, asset);
  auto stored = store_.get<aegis::schema::spending_limit_config_t>(key);
  if (!stored.has_value() || !stored->enabled) {
    return make_ok(aegis::schema::bytes_t{});
  }

  auto config = effective_spending_limit(*stored, context.now);
  if (config.period_start != stored->period_start) {
    record(aegis::schema::account_event_type_t::spending_period_reset,
           operation.account, asset, context.now);
  }
  auto available = allowance(config);
  if (amount > available) {
    auto rejected = make_error<aegis::schema::bytes_t>(
        aegis::schema::error_code_t::spending_limit_exceeded,
        kSpendingCodespace, "spending limit exceeded for period");
    rejected.violation = spending_violation_t{
        .asset = asset, .amount = amount, .remaining = available};
    return rejected;
  }

  config.spent += amount;
  store_.put(key, config);
  spdlog::debug("Recorded spend of {} on account {} ({} remaining)",
                amount.str(), aegis::schema::to_log_string(operation.account),
                allowance(config).str());
  return make_ok(encoder.encode(std::tuple{asset, amount}));
}

status_t spending_limit_hook::post_check(const call_context_t&,
                                         const aegis::schema::operation_t&,
                                         const aegis::schema::bytes_view_t&) {
  return make_ok();
}

status_t spending_limit_hook::set_spending_limit(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::asset_id_t& asset,
    const aegis::schema::amount_t& limit,
    const aegis::schema::duration_milliseconds_t period_length) {
  return store_.transact("set_spending_limit", account, context.now, [&] {
    auto allowed = authorize_admin(context, account);
    if (!allowed.ok()) {
      return allowed;
    }
    return apply_limit(context, account, asset, limit, period_length);
  });
}

status_t spending_limit_hook::remove_spending_limit(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::asset_id_t& asset) {
  return store_.transact("remove_spending_limit", account, context.now, [&] {
    auto allowed = authorize_admin(context, account);
    if (!allowed.ok()) {
      return allowed;
    }
    store_.erase(aegis::schema::key::make_spending_limit_key(
        store_.encoder(), account, asset));
    auto policy = get_policy(account);
    std::erase(policy.limited_assets, asset);
    save_policy(policy);
    record(aegis::schema::account_event_type_t::spending_limit_updated,
           account, asset, context.now);
    return make_ok();
  });
}

status_t spending_limit_hook::reset_period(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::asset_id_t& asset) {
  return store_.transact("reset_period", account, context.now, [&] {
    auto allowed = authorize_admin(context, account);
    if (!allowed.ok()) {
      return allowed;
    }
    auto key = aegis::schema::key::make_spending_limit_key(store_.encoder(),
                                                           account, asset);
    auto stored = store_.get<aegis::schema::spending_limit_config_t>(key);
    if (!stored.has_value()) {
      return make_error(aegis::schema::error_code_t::invalid_config,
                        kSpendingCodespace, "no spending limit for asset");
    }
    auto config = effective_spending_limit(*stored, context.now);
    if (config.period_start != stored->period_start) {
      store_.put(key, config);
      record(aegis::schema::account_event_type_t::spending_period_reset,
             account, asset, context.now);
    }
    return make_ok();
  });
}

status_t spending_limit_hook::set_whitelisted(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::signer_id_t& identity,
    const bool whitelisted) {
  return store_.transact("set_whitelisted", account, context.now, [&] {
    auto allowed = authorize_admin(context, account);
    if (!allowed.ok()) {
      return allowed;
    }
    if (aegis::schema::is_null(identity)) {
      return make_error(aegis::schema::error_code_t::invalid_config,
                        kSpendingCodespace, "whitelist identity is null");
    }
    auto policy = get_policy(account);
    auto listed = contains(policy.whitelist, identity);
    if (whitelisted && !listed) {
      policy.whitelist.push_back(identity);
    } else if (!whitelisted && listed) {
      std::erase(policy.whitelist, identity);
    }
    save_policy(policy);
    record(aegis::schema::account_event_type_t::spending_policy_updated,
           account, aegis::schema::kNativeAsset, context.now);
    return make_ok();
  });
}

status_t spending_limit_hook::set_paused(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const bool paused) {
  return store_.transact("set_paused", account, context.now, [&] {
    auto allowed = authorize_admin(context, account);
    if (!allowed.ok()) {
      return allowed;
    }
    auto policy = get_policy(account);
    policy.paused = paused;
    save_policy(policy);
    spdlog::info("Spending on account {} {}",
                 aegis::schema::to_log_string(account),
                 paused ? "paused" : "resumed");
    record(aegis::schema::account_event_type_t::spending_policy_updated,
           account, aegis::schema::kNativeAsset, context.now);
    return make_ok();
  });
}

std::optional<aegis::schema::spending_limit_config_t>
spending_limit_hook::get_spending_limit(
    const aegis::schema::account_id_t& account,
    const aegis::schema::asset_id_t& asset,
    const aegis::schema::timestamp_milliseconds_t now) const {
  auto stored = store_.get<aegis::schema::spending_limit_config_t>(
      aegis::schema::key::make_spending_limit_key(store_.encoder(), account,
                                                  asset));
  if (!stored.has_value()) {
    return std::nullopt;
  }
  return effective_spending_limit(*stored, now);
}

std::optional<aegis::schema::amount_t> spending_limit_hook::remaining(
    const aegis::schema::account_id_t& account,
    const aegis::schema::asset_id_t& asset,
    const aegis::schema::timestamp_milliseconds_t now) const {
  auto config = get_spending_limit(account, asset, now);
  if (!config.has_value() || !config->enabled) {
    return std::nullopt;
  }
  return allowance(*config);
}

aegis::schema::spending_policy_state_t spending_limit_hook::get_policy(
    const aegis::schema::account_id_t& account) const {
  auto policy = store_.get<aegis::schema::spending_policy_state_t>(
      aegis::schema::key::make_spending_policy_key(store_.encoder(), account));
  if (policy.has_value()) {
    return *policy;
  }
  return aegis::schema::spending_policy_state_t{.account_id = account};
}

status_t spending_limit_hook::authorize_admin(
    const call_context_t& context,
    const aegis::schema::account_id_t& account) const {
  auto state = load_account(store_, account);
  if (!state.has_value()) {
    return make_error(aegis::schema::error_code_t::account_not_found,
                      kSpendingCodespace, "account does not exist");
  }
  if (!is_account_controller(*state, context.caller)) {
    return make_error(aegis::schema::error_code_t::unauthorized,
                      kSpendingCodespace,
                      "caller is not the account or its root authority");
  }
  return make_ok();
}

status_t spending_limit_hook::apply_limit(
    const call_context_t& context,
    const aegis::schema::account_id_t& account,
    const aegis::schema::asset_id_t& asset,
    const aegis::schema::amount_t& limit,
    const aegis::schema::duration_milliseconds_t period_length) {
  if (limit == 0 || period_length == 0) {
    return make_error(aegis::schema::error_code_t::invalid_config,
                      kSpendingCodespace,
                      "limit and period length must be positive");
  }
  auto key =
      aegis::schema::key::make_spending_limit_key(store_.encoder(), account,
                                                  asset);
  auto config = store_.get<aegis::schema::spending_limit_config_t>(key)
                    .value_or(aegis::schema::spending_limit_config_t{
                        .account_id = account,
                        .asset_id = asset,
                        .period_start = context.now});
  config.limit = limit;
  config.period_length = period_length;
  config.enabled = true;
  if (config.spent > config.limit) {
    config.spent = config.limit;
  }
  store_.put(key, config);

  auto policy = get_policy(account);
  if (std::find(std::begin(policy.limited_assets),
                std::end(policy.limited_assets),
                asset) == std::end(policy.limited_assets)) {
    policy.limited_assets.push_back(asset);
    save_policy(policy);
  }
  spdlog::info("Spending limit on account {} asset {} set to {} per {} ms",
               aegis::schema::to_log_string(account),
               aegis::schema::to_log_string(asset), limit.str(),
               period_length);
  record(aegis::schema::account_event_type_t::spending_limit_updated, account,
         asset, context.now);
  return make_ok();
}

void spending_limit_hook::save_policy(
    const aegis::schema::spending_policy_state_t& policy) {
  store_.put(aegis::schema::key::make_spending_policy_key(store_.encoder(),
                                                          policy.account_id),
             policy);
}

void spending_limit_hook::record(
    const aegis::schema::account_event_type_t type,
    const aegis::schema::account_id_t& account,
    const aegis::schema::asset_id_t& asset,
    const aegis::schema::timestamp_milliseconds_t now) {
  store_.append_event(aegis::schema::account_event_record_t{
      .type = type, .account_id = account, .subject = asset,
      .recorded_at = now});
}

}  // namespace aegis::execution
