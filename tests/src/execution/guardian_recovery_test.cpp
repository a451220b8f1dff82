#include <aegis/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <vector>

namespace {

using aegis::execution::call_context_t;
using aegis::schema::error_code_t;
using aegis::testing::engine_fixture;
using aegis::testing::kDay;
using aegis::testing::kHour;
using aegis::testing::kSecond;

const auto kRoot = aegis::testing::make_named_signer(0x01);
const auto kEmergency = aegis::testing::make_named_signer(0x0E);
const auto kNewRoot = aegis::testing::make_named_signer(0x0F);
const auto kGuardian1 = aegis::testing::make_named_signer(0x61);
const auto kGuardian2 = aegis::testing::make_named_signer(0x62);
const auto kGuardian3 = aegis::testing::make_named_signer(0x63);
const auto kStranger = aegis::testing::make_named_signer(0x5A);
constexpr uint64_t kInitiatedAt = 10 * kSecond;
constexpr uint64_t kRecoveryDelay = 48 * kHour;

aegis::execution::status_t install_guardians(
    aegis::execution::engine& engine,
    const aegis::schema::account_id_t& account,
    const std::vector<aegis::schema::signer_id_t>& guardians,
    const uint32_t threshold,
    const uint64_t delay) {
  auto encoder = aegis::execution::encoder_t{};
  auto init = encoder.encode(aegis::schema::guardian_config_init_t{
      .guardians = guardians, .threshold = threshold, .recovery_delay = delay});
  return engine.accounts().install_module(
      call_context_t{kRoot, kSecond}, account,
      aegis::schema::module_type_t::validator,
      aegis::execution::guardian_recovery_validator::module_id(),
      aegis::schema::bytes_view_t{init.data(), init.size()});
}

aegis::schema::account_id_t make_guarded_account(engine_fixture& fixture) {
  auto account = fixture.create_account(kRoot, kEmergency, 0x01, kSecond);
  auto installed =
      install_guardians(fixture.engine(), account,
                        {kGuardian1, kGuardian2, kGuardian3}, 2,
                        kRecoveryDelay);
  EXPECT_TRUE(installed.ok()) << installed.log;
  return account;
}

}  // namespace

TEST(guardian_recovery, threshold_recovery_after_delay) {
  auto fixture = engine_fixture{"aegis_guardian_flow"};
  auto account = make_guarded_account(fixture);
  auto& guardians = fixture.engine().guardians();

  ASSERT_TRUE(guardians
                  .initiate_recovery(call_context_t{kGuardian1, kInitiatedAt},
                                     account, kNewRoot)
                  .ok());
  ASSERT_TRUE(guardians
                  .approve_recovery(call_context_t{kGuardian1, kInitiatedAt},
                                    account)
                  .ok());
  EXPECT_EQ(guardians.get_request(account)->approval_count, 1u);

  // Delay is checked before the threshold.
  auto early = guardians.execute_recovery(
      call_context_t{kGuardian1, kInitiatedAt + kHour}, account);
  EXPECT_EQ(early.code, error_code_t::recovery_delay_not_passed);

  ASSERT_TRUE(guardians
                  .approve_recovery(
                      call_context_t{kGuardian2, kInitiatedAt + kHour}, account)
                  .ok());
  EXPECT_EQ(guardians.get_request(account)->approval_count, 2u);

  auto executed = guardians.execute_recovery(
      call_context_t{kGuardian3, kInitiatedAt + kRecoveryDelay + kSecond},
      account);
  ASSERT_TRUE(executed.ok()) << executed.log;
  EXPECT_EQ(fixture.engine().accounts().get_account(account)->root_authority,
            kNewRoot);
  EXPECT_FALSE(guardians.get_request(account).has_value());
}

TEST(guardian_recovery, threshold_not_met_after_delay) {
  auto fixture = engine_fixture{"aegis_guardian_threshold"};
  auto account = make_guarded_account(fixture);
  auto& guardians = fixture.engine().guardians();
  ASSERT_TRUE(guardians
                  .initiate_recovery(call_context_t{kGuardian1, kInitiatedAt},
                                     account, kNewRoot)
                  .ok());
  ASSERT_TRUE(guardians
                  .approve_recovery(call_context_t{kGuardian2, kInitiatedAt},
                                    account)
                  .ok());

  auto executed = guardians.execute_recovery(
      call_context_t{kGuardian1, kInitiatedAt + kRecoveryDelay}, account);
  EXPECT_EQ(executed.code, error_code_t::threshold_not_met);
  EXPECT_EQ(fixture.engine().accounts().get_account(account)->root_authority,
            kRoot);
  EXPECT_TRUE(guardians.get_request(account).has_value());
}

TEST(guardian_recovery, delay_boundary) {
  auto fixture = engine_fixture{"aegis_guardian_boundary"};
  auto account = make_guarded_account(fixture);
  auto& guardians = fixture.engine().guardians();
  ASSERT_TRUE(guardians
                  .initiate_recovery(call_context_t{kGuardian1, kInitiatedAt},
                                     account, kNewRoot)
                  .ok());
  for (const auto& guardian : {kGuardian1, kGuardian2}) {
    ASSERT_TRUE(guardians
                    .approve_recovery(call_context_t{guardian, kInitiatedAt},
                                      account)
                    .ok());
  }

  for (const auto offset : {uint64_t{0}, kHour, kRecoveryDelay - 1}) {
    EXPECT_EQ(guardians
                  .execute_recovery(
                      call_context_t{kGuardian1, kInitiatedAt + offset},
                      account)
                  .code,
              error_code_t::recovery_delay_not_passed)
        << "offset " << offset;
  }
  EXPECT_TRUE(guardians
                  .execute_recovery(
                      call_context_t{kGuardian1, kInitiatedAt + kRecoveryDelay},
                      account)
                  .ok());
}

TEST(guardian_recovery, maximum_delay_never_elapses) {
  auto fixture = engine_fixture{"aegis_guardian_max_delay"};
  auto account = fixture.create_account(kRoot, kEmergency, 0x01, kSecond);
  ASSERT_TRUE(install_guardians(fixture.engine(), account,
                                {kGuardian1, kGuardian2, kGuardian3}, 2,
                                std::numeric_limits<uint64_t>::max())
                  .ok());
  auto& guardians = fixture.engine().guardians();
  ASSERT_TRUE(guardians
                  .initiate_recovery(call_context_t{kGuardian1, kInitiatedAt},
                                     account, kNewRoot)
                  .ok());
  for (const auto& guardian : {kGuardian1, kGuardian2}) {
    ASSERT_TRUE(guardians
                    .approve_recovery(call_context_t{guardian, kInitiatedAt},
                                      account)
                    .ok());
  }

  for (const auto offset : {uint64_t{0}, kDay, 3650 * kDay}) {
    EXPECT_EQ(guardians
                  .execute_recovery(
                      call_context_t{kGuardian1, kInitiatedAt + offset},
                      account)
                  .code,
              error_code_t::recovery_delay_not_passed)
        << "offset " << offset;
  }
  EXPECT_EQ(fixture.engine().accounts().get_account(account)->root_authority,
            kRoot);
}

TEST(guardian_recovery, workflow_errors) {
  auto fixture = engine_fixture{"aegis_guardian_errors"};
  auto account = make_guarded_account(fixture);
  auto& guardians = fixture.engine().guardians();
  auto at = call_context_t{kGuardian1, kInitiatedAt};

  EXPECT_EQ(guardians.approve_recovery(at, account).code,
            error_code_t::recovery_not_initiated);
  EXPECT_EQ(guardians.execute_recovery(at, account).code,
            error_code_t::recovery_not_initiated);
  EXPECT_EQ(guardians
                .initiate_recovery(call_context_t{kStranger, kInitiatedAt},
                                   account, kNewRoot)
                .code,
            error_code_t::unauthorized);
  EXPECT_EQ(guardians
                .initiate_recovery(at, account, aegis::schema::signer_id_t{})
                .code,
            error_code_t::invalid_validator);

  ASSERT_TRUE(guardians.initiate_recovery(at, account, kNewRoot).ok());
  EXPECT_EQ(guardians
                .initiate_recovery(call_context_t{kGuardian2, kInitiatedAt},
                                   account, kNewRoot)
                .code,
            error_code_t::recovery_already_initiated);
  ASSERT_TRUE(guardians.approve_recovery(at, account).ok());
  EXPECT_EQ(guardians.approve_recovery(at, account).code,
            error_code_t::already_approved);
  EXPECT_EQ(guardians
                .approve_recovery(call_context_t{kStranger, kInitiatedAt},
                                  account)
                .code,
            error_code_t::unauthorized);
  EXPECT_EQ(guardians
                .execute_recovery(call_context_t{kStranger,
                                                 kInitiatedAt + kRecoveryDelay},
                                  account)
                .code,
            error_code_t::unauthorized);
}

TEST(guardian_recovery, root_authority_cancels_outstanding_request) {
  auto fixture = engine_fixture{"aegis_guardian_cancel"};
  auto account = make_guarded_account(fixture);
  auto& guardians = fixture.engine().guardians();
  ASSERT_TRUE(guardians
                  .initiate_recovery(call_context_t{kGuardian1, kInitiatedAt},
                                     account, kNewRoot)
                  .ok());

  EXPECT_EQ(guardians
                .cancel_recovery(call_context_t{kGuardian2, kInitiatedAt},
                                 account)
                .code,
            error_code_t::unauthorized);
  ASSERT_TRUE(guardians
                  .cancel_recovery(call_context_t{kRoot, kInitiatedAt}, account)
                  .ok());
  EXPECT_FALSE(guardians.get_request(account).has_value());
  EXPECT_EQ(guardians
                .cancel_recovery(call_context_t{kRoot, kInitiatedAt}, account)
                .code,
            error_code_t::recovery_not_initiated);

  // A fresh request may follow a cancelled one.
  EXPECT_TRUE(guardians
                  .initiate_recovery(call_context_t{kGuardian2, kInitiatedAt},
                                     account, kNewRoot)
                  .ok());
}

TEST(guardian_recovery, install_data_is_validated) {
  auto fixture = engine_fixture{"aegis_guardian_install"};
  auto& engine = fixture.engine();
  auto account = fixture.create_account(kRoot, kEmergency, 0x01, kSecond);

  EXPECT_EQ(install_guardians(engine, account, {kGuardian1, kGuardian2}, 1,
                              kHour)
                .code,
            error_code_t::invalid_config);
  EXPECT_EQ(install_guardians(engine, account, {kGuardian1, kGuardian2}, 3,
                              kHour)
                .code,
            error_code_t::invalid_config);
  EXPECT_EQ(
      install_guardians(engine, account, {kGuardian1, kGuardian2}, 2, 0).code,
      error_code_t::invalid_config);
  EXPECT_EQ(install_guardians(engine, account, {kGuardian1, kGuardian1}, 2,
                              kHour)
                .code,
            error_code_t::invalid_config);
  EXPECT_EQ(install_guardians(engine, account,
                              {kGuardian1, aegis::schema::signer_id_t{}}, 2,
                              kHour)
                .code,
            error_code_t::invalid_config);

  auto truncated = aegis::schema::bytes_t{0x01};
  EXPECT_EQ(engine.accounts()
                .install_module(
                    call_context_t{kRoot, kSecond}, account,
                    aegis::schema::module_type_t::validator,
                    aegis::execution::guardian_recovery_validator::module_id(),
                    aegis::schema::bytes_view_t{truncated.data(),
                                                truncated.size()})
                .code,
            error_code_t::invalid_config);

  ASSERT_TRUE(install_guardians(engine, account, {kGuardian1, kGuardian2}, 2,
                                kHour)
                  .ok());
  auto config = engine.guardians().get_config(account);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->threshold, 2u);
  EXPECT_EQ(config->guardians.size(), 2u);
  EXPECT_TRUE(engine.guardians().is_guardian(account, kGuardian2));
  EXPECT_FALSE(engine.guardians().is_guardian(account, kGuardian3));
}

TEST(guardian_recovery, guardian_set_management) {
  auto fixture = engine_fixture{"aegis_guardian_manage"};
  auto account = make_guarded_account(fixture);
  auto& guardians = fixture.engine().guardians();
  auto as_root = call_context_t{kRoot, 2 * kSecond};
  auto fourth = aegis::testing::make_named_signer(0x64);

  EXPECT_EQ(guardians
                .add_guardian(call_context_t{kGuardian1, 2 * kSecond}, account,
                              fourth)
                .code,
            error_code_t::unauthorized);
  ASSERT_TRUE(guardians.add_guardian(as_root, account, fourth).ok());
  EXPECT_TRUE(guardians.is_guardian(account, fourth));
  EXPECT_EQ(guardians.add_guardian(as_root, account, fourth).code,
            error_code_t::invalid_config);

  ASSERT_TRUE(guardians.update_threshold(as_root, account, 4).ok());
  EXPECT_EQ(guardians.update_threshold(as_root, account, 5).code,
            error_code_t::invalid_config);
  EXPECT_EQ(guardians.update_threshold(as_root, account, 1).code,
            error_code_t::invalid_config);
  // Removing a guardian may not leave the threshold unreachable.
  EXPECT_EQ(guardians.remove_guardian(as_root, account, fourth).code,
            error_code_t::invalid_config);
  ASSERT_TRUE(guardians.update_threshold(as_root, account, 3).ok());
  ASSERT_TRUE(guardians.remove_guardian(as_root, account, fourth).ok());
  EXPECT_FALSE(guardians.is_guardian(account, fourth));

  EXPECT_EQ(guardians.update_recovery_delay(as_root, account, 0).code,
            error_code_t::invalid_config);
  ASSERT_TRUE(guardians.update_recovery_delay(as_root, account, kHour).ok());
  auto config = guardians.get_config(account);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->threshold, 3u);
  EXPECT_EQ(config->recovery_delay, kHour);
  EXPECT_EQ(config->guardians.size(), 3u);

  auto unguarded = fixture.create_account(kRoot, kEmergency, 0x02, kSecond);
  EXPECT_EQ(guardians.add_guardian(as_root, unguarded, fourth).code,
            error_code_t::module_state_error);
}

TEST(guardian_recovery, removed_guardian_approval_no_longer_counts) {
  auto fixture = engine_fixture{"aegis_guardian_removed_approval"};
  auto account = make_guarded_account(fixture);
  auto& guardians = fixture.engine().guardians();
  ASSERT_TRUE(guardians
                  .initiate_recovery(call_context_t{kGuardian1, kInitiatedAt},
                                     account, kNewRoot)
                  .ok());
  for (const auto& guardian : {kGuardian1, kGuardian2}) {
    ASSERT_TRUE(guardians
                    .approve_recovery(call_context_t{guardian, kInitiatedAt},
                                      account)
                    .ok());
  }
  ASSERT_TRUE(guardians
                  .add_guardian(call_context_t{kRoot, kInitiatedAt}, account,
                                aegis::testing::make_named_signer(0x64))
                  .ok());
  EXPECT_EQ(guardians.get_request(account)->approval_count, 2u);

  ASSERT_TRUE(guardians
                  .remove_guardian(call_context_t{kRoot, kInitiatedAt},
                                   account, kGuardian2)
                  .ok());
  auto request = guardians.get_request(account);
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->approval_count, 1u);
  EXPECT_EQ(request->approvals,
            std::vector<aegis::schema::signer_id_t>{kGuardian1});

  auto after_delay = kInitiatedAt + kRecoveryDelay;
  EXPECT_EQ(guardians
                .execute_recovery(call_context_t{kGuardian1, after_delay},
                                  account)
                .code,
            error_code_t::threshold_not_met);
  ASSERT_TRUE(guardians
                  .approve_recovery(call_context_t{kGuardian3, after_delay},
                                    account)
                  .ok());
  EXPECT_TRUE(guardians
                  .execute_recovery(call_context_t{kGuardian1, after_delay},
                                    account)
                  .ok());
  EXPECT_EQ(fixture.engine().accounts().get_account(account)->root_authority,
            kNewRoot);
}

TEST(guardian_recovery, authorizes_no_operations_or_signatures) {
  auto fixture = engine_fixture{"aegis_guardian_validator"};
  auto account = make_guarded_account(fixture);
  auto& engine = fixture.engine();
  auto module_id = aegis::execution::guardian_recovery_validator::module_id();

  auto operation = aegis::schema::operation_t{.account = account,
                                              .validation_id = module_id,
                                              .signer = kGuardian1};
  auto executed = engine.accounts().execute(
      call_context_t{engine_fixture::entry_point(), 2 * kSecond}, operation);
  EXPECT_EQ(executed.code, error_code_t::unauthorized);

  auto signature = engine.validation().is_valid_signature(
      account, aegis::testing::make_hash(0xC0), kGuardian1,
      aegis::schema::signature_t{aegis::schema::ed25519_signature_t{}},
      module_id, 2 * kSecond);
  EXPECT_EQ(signature.code, error_code_t::unauthorized);
}

TEST(guardian_recovery, uninstall_clears_config_and_request) {
  auto fixture = engine_fixture{"aegis_guardian_uninstall"};
  auto account = make_guarded_account(fixture);
  auto& engine = fixture.engine();
  ASSERT_TRUE(engine.guardians()
                  .initiate_recovery(call_context_t{kGuardian1, kInitiatedAt},
                                     account, kNewRoot)
                  .ok());

  ASSERT_TRUE(engine.accounts()
                  .uninstall_module(
                      call_context_t{kRoot, kInitiatedAt}, account,
                      aegis::schema::module_type_t::validator,
                      aegis::execution::guardian_recovery_validator::
                          module_id(),
                      {})
                  .ok());
  EXPECT_FALSE(engine.guardians().get_config(account).has_value());
  EXPECT_FALSE(engine.guardians().get_request(account).has_value());
  EXPECT_EQ(engine.guardians()
                .approve_recovery(call_context_t{kGuardian2, kInitiatedAt},
                                  account)
                .code,
            error_code_t::unauthorized);
}
