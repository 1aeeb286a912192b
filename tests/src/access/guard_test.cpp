#include <vestlock/access/guard.hpp>
#include <vestlock/schema/lock_event.hpp>
#include <vestlock/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

using namespace vestlock::schema;
using vestlock::testing::make_hash;
using vestlock::testing::scoped_path;

namespace {

struct guard_fixture final {
  explicit guard_fixture(const std::string_view prefix)
      : path{prefix},
        storage{vestlock::storage::make_storage<
            vestlock::storage::rocksdb_storage_tag>(path.string())},
        guard{storage} {}

  scoped_path path;
  vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag> storage;
  vestlock::access::guard guard;
};

}  // namespace

TEST(access_guard, fresh_vault_has_no_controller) {
  auto fixture = guard_fixture{"vestlock_guard_fresh"};

  EXPECT_FALSE(fixture.guard.controller().has_value());
  EXPECT_FALSE(fixture.guard.renounced());
  EXPECT_FALSE(fixture.guard.authorize(make_hash(1)));
  EXPECT_FALSE(fixture.guard.authorize(make_zero_hash()));
}

TEST(access_guard, bootstrap_assigns_controller_once) {
  auto fixture = guard_fixture{"vestlock_guard_bootstrap"};

  auto result = fixture.guard.bootstrap(make_hash(1));

  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(fixture.guard.authorize(make_hash(1)));
  EXPECT_FALSE(fixture.guard.authorize(make_hash(2)));
  EXPECT_EQ(fixture.guard.bootstrap(make_hash(2)).error(),
            lock_error_code::controller_already_set);
  EXPECT_EQ(fixture.guard.controller(), std::optional{make_hash(1)});
}

TEST(access_guard, bootstrap_rejects_null_controller) {
  auto fixture = guard_fixture{"vestlock_guard_bootstrap_null"};

  EXPECT_EQ(fixture.guard.bootstrap(make_zero_hash()).error(),
            lock_error_code::invalid_controller);
  EXPECT_FALSE(fixture.guard.controller().has_value());
}

TEST(access_guard, transfer_control_moves_authority) {
  auto fixture = guard_fixture{"vestlock_guard_transfer"};
  ASSERT_TRUE(fixture.guard.bootstrap(make_hash(1)).ok());

  auto result = fixture.guard.transfer_control(make_hash(1), make_hash(2));

  ASSERT_TRUE(result.ok());
  EXPECT_FALSE(fixture.guard.authorize(make_hash(1)));
  EXPECT_TRUE(fixture.guard.authorize(make_hash(2)));
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, kControllerTransferredEvent);
  EXPECT_EQ(find_attribute(result.events[0], "previous"),
            std::optional{to_hex(make_hash(1))});
  EXPECT_EQ(find_attribute(result.events[0], "next"),
            std::optional{to_hex(make_hash(2))});
}

TEST(access_guard, transfer_control_failure_modes) {
  auto fixture = guard_fixture{"vestlock_guard_transfer_failures"};
  ASSERT_TRUE(fixture.guard.bootstrap(make_hash(1)).ok());

  EXPECT_EQ(fixture.guard.transfer_control(make_hash(2), make_hash(3)).error(),
            lock_error_code::not_authorized);
  EXPECT_EQ(
      fixture.guard.transfer_control(make_hash(1), make_zero_hash()).error(),
      lock_error_code::invalid_controller);
  EXPECT_TRUE(fixture.guard.authorize(make_hash(1)));
}

TEST(access_guard, renounce_is_permanent) {
  auto fixture = guard_fixture{"vestlock_guard_renounce"};
  ASSERT_TRUE(fixture.guard.bootstrap(make_hash(1)).ok());

  EXPECT_EQ(fixture.guard.renounce_control(make_hash(2)).error(),
            lock_error_code::not_authorized);
  ASSERT_TRUE(fixture.guard.renounce_control(make_hash(1)).ok());

  EXPECT_TRUE(fixture.guard.renounced());
  EXPECT_FALSE(fixture.guard.controller().has_value());
  EXPECT_FALSE(fixture.guard.authorize(make_hash(1)));
  EXPECT_FALSE(fixture.guard.authorize(make_zero_hash()));
  EXPECT_EQ(fixture.guard.bootstrap(make_hash(3)).error(),
            lock_error_code::controller_already_set);
  EXPECT_EQ(fixture.guard.transfer_control(make_hash(1), make_hash(3)).error(),
            lock_error_code::not_authorized);
}
