#pragma once

#include <aegis/schema/primitives.hpp>

// Schema type: spending limit config.
// Rolling-period outflow quota of one asset for one account.
namespace aegis::schema {

template <uint16_t Version>
struct spending_limit_config;

template <>
struct spending_limit_config<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  asset_id_t asset_id{};
  amount_t limit{};
  duration_milliseconds_t period_length{};
  amount_t spent{};
  timestamp_milliseconds_t period_start{};
  bool enabled{};
};

using spending_limit_config_t = spending_limit_config<1>;

/// One entry of the spending limit hook's install data.
template <uint16_t Version>
struct spending_limit_rule;

template <>
struct spending_limit_rule<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  amount_t limit{};
  duration_milliseconds_t period_length{};
};

using spending_limit_rule_t = spending_limit_rule<1>;

}  // namespace aegis::schema
