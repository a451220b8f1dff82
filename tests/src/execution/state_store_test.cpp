#include <aegis/execution/state_store.hpp>
#include <aegis/testing/common.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace {

using aegis::schema::error_code_t;

class state_store_fixture final {
 public:
  state_store_fixture()
      : path_{aegis::testing::make_db_path("aegis_state_store")},
        storage_{std::make_unique<aegis::execution::storage_t>(
            aegis::storage::make_storage<
                aegis::storage::rocksdb_storage_tag>(path_))},
        store_{encoder_, *storage_} {}

  ~state_store_fixture() {
    storage_.reset();
    aegis::testing::remove_path(path_);
  }

  aegis::execution::state_store& store() { return store_; }

  aegis::schema::bytes_t key(const uint8_t seed) {
    return aegis::schema::key::make_account_key(
        encoder_, aegis::testing::make_hash(seed));
  }

  std::optional<uint64_t> committed(const uint8_t seed) {
    auto raw = storage_->get_raw(key(seed));
    if (!raw.has_value()) {
      return std::nullopt;
    }
    return encoder_.decode<uint64_t>(
        aegis::schema::bytes_view_t{raw->data(), raw->size()});
  }

 private:
  std::string path_;
  aegis::execution::encoder_t encoder_;
  std::unique_ptr<aegis::execution::storage_t> storage_;
  aegis::execution::state_store store_;
};

const auto kAccount = aegis::testing::make_hash(0xA0);

}  // namespace

TEST(state_store, successful_operation_commits_every_write) {
  auto fixture = state_store_fixture{};
  auto& store = fixture.store();

  auto outcome = store.transact("write", kAccount, 1, [&] {
    store.put(fixture.key(1), uint64_t{10});
    store.put(fixture.key(2), uint64_t{20});
    EXPECT_EQ(store.get<uint64_t>(fixture.key(1)), uint64_t{10});
    return aegis::execution::make_ok();
  });

  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(fixture.committed(1), uint64_t{10});
  EXPECT_EQ(fixture.committed(2), uint64_t{20});
}

TEST(state_store, rejected_operation_discards_writes_and_records_denial) {
  auto fixture = state_store_fixture{};
  auto& store = fixture.store();

  auto outcome = store.transact("write", kAccount, 7, [&] {
    store.put(fixture.key(1), uint64_t{10});
    return aegis::execution::make_error(error_code_t::unauthorized,
                                        "aegis.account", "denied");
  });

  EXPECT_EQ(outcome.code, error_code_t::unauthorized);
  EXPECT_FALSE(fixture.committed(1).has_value());

  auto denial = store.get_event(0);
  ASSERT_TRUE(denial.has_value());
  EXPECT_EQ(denial->type,
            aegis::schema::account_event_type_t::operation_denied);
  EXPECT_EQ(denial->account_id, kAccount);
  EXPECT_EQ(denial->code, static_cast<uint32_t>(error_code_t::unauthorized));
  EXPECT_EQ(denial->recorded_at, 7u);
}

TEST(state_store, durable_writes_survive_rejection) {
  auto fixture = state_store_fixture{};
  auto& store = fixture.store();

  auto outcome = store.transact("expire", kAccount, 1, [&] {
    store.put_durable(fixture.key(1), uint64_t{1});
    store.put(fixture.key(2), uint64_t{2});
    return aegis::execution::make_error(error_code_t::delegation_expired,
                                        "aegis.delegation", "expired");
  });

  EXPECT_FALSE(outcome.ok());
  EXPECT_EQ(fixture.committed(1), uint64_t{1});
  EXPECT_FALSE(fixture.committed(2).has_value());
}

TEST(state_store, retained_operation_keeps_writes_on_failure) {
  auto fixture = state_store_fixture{};
  auto& store = fixture.store();

  auto outcome = store.transact("execute", kAccount, 1, [&] {
    store.put(fixture.key(1), uint64_t{5});
    store.retain_on_failure();
    return aegis::execution::make_error(error_code_t::execution_failed,
                                        "aegis.account", "call failed");
  });

  EXPECT_EQ(outcome.code, error_code_t::execution_failed);
  EXPECT_EQ(fixture.committed(1), uint64_t{5});
}

TEST(state_store, nested_success_merges_into_parent) {
  auto fixture = state_store_fixture{};
  auto& store = fixture.store();

  auto outcome = store.transact("outer", kAccount, 1, [&] {
    auto inner = store.transact("inner", kAccount, 1, [&] {
      store.put(fixture.key(1), uint64_t{1});
      return aegis::execution::make_ok();
    });
    EXPECT_TRUE(inner.ok());
    // Nothing reaches storage until the outermost operation finishes.
    EXPECT_FALSE(fixture.committed(1).has_value());
    EXPECT_EQ(store.get<uint64_t>(fixture.key(1)), uint64_t{1});
    return aegis::execution::make_ok();
  });

  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(fixture.committed(1), uint64_t{1});
}

TEST(state_store, outer_rejection_rolls_back_nested_success) {
  auto fixture = state_store_fixture{};
  auto& store = fixture.store();

  auto outcome = store.transact("outer", kAccount, 1, [&] {
    auto inner = store.transact("inner", kAccount, 1, [&] {
      store.put(fixture.key(1), uint64_t{1});
      return aegis::execution::make_ok();
    });
    EXPECT_TRUE(inner.ok());
    return aegis::execution::make_error(error_code_t::unauthorized,
                                        "aegis.account", "denied");
  });

  EXPECT_FALSE(outcome.ok());
  EXPECT_FALSE(fixture.committed(1).has_value());
}

TEST(state_store, nested_rejection_leaves_parent_writes_intact) {
  auto fixture = state_store_fixture{};
  auto& store = fixture.store();

  auto outcome = store.transact("outer", kAccount, 1, [&] {
    store.put(fixture.key(1), uint64_t{1});
    auto inner = store.transact("inner", kAccount, 1, [&] {
      store.put(fixture.key(2), uint64_t{2});
      return aegis::execution::make_error(error_code_t::unauthorized,
                                          "aegis.account", "denied");
    });
    EXPECT_FALSE(inner.ok());
    EXPECT_FALSE(store.get<uint64_t>(fixture.key(2)).has_value());
    return aegis::execution::make_ok();
  });

  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(fixture.committed(1), uint64_t{1});
  EXPECT_FALSE(fixture.committed(2).has_value());
}

TEST(state_store, sequences_advance_and_erase_deletes) {
  auto fixture = state_store_fixture{};
  auto& store = fixture.store();

  auto outcome = store.transact("sequence", kAccount, 1, [&] {
    EXPECT_EQ(store.next_sequence(fixture.key(3), false), 0u);
    EXPECT_EQ(store.next_sequence(fixture.key(3), false), 1u);
    store.put(fixture.key(4), uint64_t{4});
    store.erase(fixture.key(4));
    EXPECT_FALSE(store.get_raw(fixture.key(4)).has_value());
    return aegis::execution::make_ok();
  });

  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(fixture.committed(3), uint64_t{2});
  EXPECT_FALSE(fixture.committed(4).has_value());
}
