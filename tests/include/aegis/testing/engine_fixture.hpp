#pragma once

#include <aegis/execution/engine.hpp>
#include <aegis/schema/primitives.hpp>
#include <aegis/testing/common.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <string_view>

namespace aegis::testing {

/// Engine over a fresh temporary RocksDB path, removed on destruction.
class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix,
                          const bool install_allow_all_verifier = true)
      : db_path_{make_db_path(db_prefix)},
        install_allow_all_verifier_{install_allow_all_verifier} {
    open();
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    engine_.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }

  aegis::execution::engine& engine() { return *engine_; }

  /// Close and reopen the engine over the same database.
  void restart() {
    engine_.reset();
    open();
  }

  static aegis::schema::signer_id_t entry_point() {
    return make_named_signer(0xE0);
  }

  static aegis::schema::signer_id_t registry_admin() {
    return make_named_signer(0xAD);
  }

  static aegis::execution::signature_verifier_t allow_all_verifier() {
    return [](const aegis::schema::bytes_view_t&,
              const aegis::schema::signer_id_t&,
              const aegis::schema::signature_t&) { return true; };
  }

  static aegis::execution::signature_verifier_t reject_all_verifier() {
    return [](const aegis::schema::bytes_view_t&,
              const aegis::schema::signer_id_t&,
              const aegis::schema::signature_t&) { return false; };
  }

  /// Create an account and fail the test when creation is rejected.
  aegis::schema::account_id_t create_account(
      const aegis::schema::signer_id_t& root,
      const aegis::schema::signer_id_t& emergency,
      const uint8_t salt_seed,
      const uint64_t now) {
    auto created = engine_->accounts().create_account(
        aegis::execution::call_context_t{root, now}, root, emergency,
        make_hash(salt_seed));
    EXPECT_TRUE(created.ok()) << created.log;
    return created.value.value_or(aegis::schema::account_id_t{});
  }

 private:
  void open() {
    engine_ = std::make_unique<aegis::execution::engine>(
        aegis::execution::engine_config_t{.db_path = db_path_,
                                          .entry_point = entry_point(),
                                          .registry_admin = registry_admin()});
    if (install_allow_all_verifier_) {
      engine_->set_signature_verifier(allow_all_verifier());
    }
  }

  std::string db_path_;
  bool install_allow_all_verifier_{true};
  std::unique_ptr<aegis::execution::engine> engine_;
};

}  // namespace aegis::testing
