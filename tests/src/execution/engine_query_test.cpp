#include <aegis/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <tuple>
#include <vector>

namespace {

using aegis::execution::call_context_t;
using aegis::schema::query_error_code;
using aegis::testing::engine_fixture;
using aegis::testing::kDay;
using aegis::testing::kSecond;

const auto kRoot = aegis::testing::make_named_signer(0x01);
const auto kEmergency = aegis::testing::make_named_signer(0x0E);
const auto kSessionKey = aegis::testing::make_named_signer(0x51);

template <typename T>
aegis::schema::bytes_t encode(const T& value) {
  auto encoder = aegis::execution::encoder_t{};
  return encoder.encode(value);
}

template <typename T>
T decode(const aegis::schema::bytes_t& bytes) {
  auto encoder = aegis::execution::encoder_t{};
  return encoder.decode<T>(aegis::schema::bytes_view_t{bytes.data(),
                                                       bytes.size()});
}

aegis::schema::query_result_t run_query(aegis::execution::engine& engine,
                                        const std::string_view path,
                                        const aegis::schema::bytes_t& key) {
  return engine.query(path, aegis::schema::bytes_view_t{key.data(), key.size()});
}

}  // namespace

TEST(engine_query, account_route) {
  auto fixture = engine_fixture{"aegis_query_account"};
  auto account = fixture.create_account(kRoot, kEmergency, 0x01, kSecond);

  auto found = run_query(fixture.engine(), "/account", encode(account));
  ASSERT_EQ(found.code, 0u) << found.log;
  EXPECT_EQ(found.key, encode(account));
  auto state = decode<aegis::schema::account_state_t>(found.value);
  EXPECT_EQ(state.account_id, account);
  EXPECT_EQ(state.root_authority, kRoot);

  auto missing = run_query(fixture.engine(), "/account",
                           encode(aegis::testing::make_hash(0x99)));
  EXPECT_EQ(missing.code, static_cast<uint32_t>(query_error_code::not_found));
  EXPECT_EQ(missing.codespace, "aegis.query");

  auto malformed =
      run_query(fixture.engine(), "/account", aegis::schema::bytes_t{0x01});
  EXPECT_EQ(malformed.code,
            static_cast<uint32_t>(query_error_code::invalid_key));
}

TEST(engine_query, unsupported_path) {
  auto fixture = engine_fixture{"aegis_query_path"};
  auto result = run_query(fixture.engine(), "/accounts/all", {});
  EXPECT_EQ(result.code,
            static_cast<uint32_t>(query_error_code::unsupported_path));
  EXPECT_TRUE(result.value.empty());
}

TEST(engine_query, delegation_routes_report_effective_status) {
  auto fixture = engine_fixture{"aegis_query_delegation"};
  auto& engine = fixture.engine();
  auto account = fixture.create_account(kRoot, kEmergency, 0x01, kSecond);
  auto created = engine.delegations().create_delegation(
      call_context_t{kRoot, kSecond}, account,
      aegis::schema::delegation_params_t{.delegatee = kSessionKey,
                                         .duration = kDay});
  ASSERT_TRUE(created.ok()) << created.log;
  auto id = *created.value;

  auto active = run_query(engine, "/delegation", encode(std::tuple{id, kSecond}));
  ASSERT_EQ(active.code, 0u) << active.log;
  EXPECT_EQ(decode<aegis::schema::delegation_state_t>(active.value).status,
            aegis::schema::delegation_status_t::active);

  auto after_end = kSecond + kDay + 1;
  auto expired =
      run_query(engine, "/delegation", encode(std::tuple{id, after_end}));
  ASSERT_EQ(expired.code, 0u) << expired.log;
  EXPECT_EQ(decode<aegis::schema::delegation_state_t>(expired.value).status,
            aegis::schema::delegation_status_t::expired);

  auto listed = run_query(engine, "/delegations/by_delegator",
                          encode(std::tuple{account, kSecond}));
  ASSERT_EQ(listed.code, 0u) << listed.log;
  auto states =
      decode<std::vector<aegis::schema::delegation_state_t>>(listed.value);
  ASSERT_EQ(states.size(), 1u);
  EXPECT_EQ(states[0].delegation_id, id);

  auto unknown = run_query(
      engine, "/delegation",
      encode(std::tuple{aegis::testing::make_hash(0x99), kSecond}));
  EXPECT_EQ(unknown.code, static_cast<uint32_t>(query_error_code::not_found));
}

TEST(engine_query, guardian_and_spending_routes) {
  auto fixture = engine_fixture{"aegis_query_modules"};
  auto& engine = fixture.engine();
  auto account = fixture.create_account(kRoot, kEmergency, 0x01, kSecond);
  auto as_root = call_context_t{kRoot, kSecond};
  auto guardian = aegis::testing::make_named_signer(0x61);
  auto init = encode(aegis::schema::guardian_config_init_t{
      .guardians = {guardian, aegis::testing::make_named_signer(0x62)},
      .threshold = 2,
      .recovery_delay = kDay});
  ASSERT_TRUE(engine.accounts()
                  .install_module(as_root, account,
                                  aegis::schema::module_type_t::validator,
                                  aegis::execution::
                                      guardian_recovery_validator::module_id(),
                                  aegis::schema::bytes_view_t{init.data(),
                                                              init.size()})
                  .ok());

  auto config = run_query(engine, "/guardian/config", encode(account));
  ASSERT_EQ(config.code, 0u) << config.log;
  EXPECT_EQ(decode<aegis::schema::guardian_config_t>(config.value).threshold,
            2u);
  EXPECT_EQ(run_query(engine, "/guardian/request", encode(account)).code,
            static_cast<uint32_t>(query_error_code::not_found));
  ASSERT_TRUE(engine.guardians()
                  .initiate_recovery(call_context_t{guardian, 2 * kSecond},
                                     account,
                                     aegis::testing::make_named_signer(0x0F))
                  .ok());
  auto request = run_query(engine, "/guardian/request", encode(account));
  ASSERT_EQ(request.code, 0u) << request.log;
  EXPECT_EQ(
      decode<aegis::schema::recovery_request_t>(request.value).initiated_by,
      guardian);

  auto token = aegis::testing::make_hash(0x7A);
  ASSERT_TRUE(engine.spending()
                  .set_spending_limit(as_root, account, token,
                                      aegis::testing::tokens(10), kDay)
                  .ok());
  auto limit = run_query(engine, "/spending/limit",
                         encode(std::tuple{account, token, 2 * kSecond}));
  ASSERT_EQ(limit.code, 0u) << limit.log;
  auto stored = decode<aegis::schema::spending_limit_config_t>(limit.value);
  EXPECT_EQ(stored.limit, aegis::testing::tokens(10));
  EXPECT_TRUE(stored.enabled);
}

TEST(engine_query, event_ranges) {
  auto fixture = engine_fixture{"aegis_query_events"};
  auto& engine = fixture.engine();
  auto account = fixture.create_account(kRoot, kEmergency, 0x01, kSecond);
  ASSERT_TRUE(engine.accounts()
                  .set_root_authority(call_context_t{kRoot, 2 * kSecond},
                                      account,
                                      aegis::testing::make_named_signer(0x02))
                  .ok());

  auto all = engine.events(0, 100);
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].event_id, 0u);
  EXPECT_EQ(all[1].type,
            aegis::schema::account_event_type_t::root_authority_changed);
  EXPECT_EQ(engine.events(1, 1).size(), 1u);
  EXPECT_TRUE(engine.events(5, 9).empty());
  EXPECT_TRUE(engine.events(1, 0).empty());

  auto ranged = run_query(engine, "/events/range",
                          encode(std::tuple{uint64_t{0}, uint64_t{1}}));
  ASSERT_EQ(ranged.code, 0u) << ranged.log;
  EXPECT_EQ(
      decode<std::vector<aegis::schema::account_event_record_t>>(ranged.value)
          .size(),
      2u);
  EXPECT_EQ(run_query(engine, "/events/range",
                      encode(std::tuple{uint64_t{3}, uint64_t{1}}))
                .code,
            static_cast<uint32_t>(query_error_code::invalid_key));
}

TEST(engine_query, keyspace_sizes_count_committed_entries) {
  auto fixture = engine_fixture{"aegis_query_keyspaces"};
  fixture.create_account(kRoot, kEmergency, 0x01, kSecond);
  fixture.create_account(kRoot, kEmergency, 0x02, kSecond);

  auto sizes = fixture.engine().keyspace_sizes();
  EXPECT_EQ(sizes.size(), aegis::schema::key::kEngineKeyspaces.size());
  auto accounts = std::find_if(
      sizes.begin(), sizes.end(), [](const auto& entry) {
        return entry.first == aegis::schema::key::kAccountKeyPrefix;
      });
  ASSERT_NE(accounts, sizes.end());
  EXPECT_EQ(accounts->second, 2u);
  auto events = std::find_if(sizes.begin(), sizes.end(), [](const auto& entry) {
    return entry.first == aegis::schema::key::kEventPrefix;
  });
  ASSERT_NE(events, sizes.end());
  EXPECT_EQ(events->second, 2u);
}
