#include <vestlock/schema/lock_event.hpp>
#include <vestlock/testing/vault_fixture.hpp>
#include <vestlock/vault/timelock.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <optional>
#include <string>

using namespace vestlock::schema;
using vestlock::testing::kGenesisTime;
using vestlock::testing::make_amount;
using vestlock::testing::make_hash;
using vestlock::testing::vault_fixture;
using vestlock::vault::kLockDuration;

namespace {

constexpr auto kOneDay = duration_milliseconds_t{24ULL * 60 * 60 * 1000};

void fund_controller(vault_fixture& fixture, const uint64_t amount) {
  fixture.ledger().set_balance(fixture.asset(), fixture.controller(),
                               make_amount(amount));
}

command_result_t lock(vault_fixture& fixture,
                      const uint64_t amount,
                      const timestamp_milliseconds_t now = kGenesisTime) {
  return fixture.timelock().initiate_lock(fixture.controller(),
                                          fixture.asset(), make_amount(amount),
                                          now);
}

}  // namespace

TEST(timelock, lock_duration_is_182_days) {
  EXPECT_EQ(kLockDuration, 15724800000ULL);
  EXPECT_EQ(vestlock::vault::timelock::lock_duration(), 182 * kOneDay);
}

TEST(timelock, initiate_lock_pulls_funds_and_sets_maturity) {
  auto fixture = vault_fixture{"vestlock_timelock_initiate"};
  fund_controller(fixture, 1000);

  auto result = lock(fixture, 600);

  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(fixture.ledger().pull_calls, 1);
  EXPECT_EQ(fixture.timelock().maturity_of(fixture.asset()),
            std::optional{kGenesisTime + kLockDuration});
  EXPECT_EQ(fixture.timelock().held_balance_of(fixture.asset()),
            make_amount(600));
  EXPECT_EQ(fixture.ledger().balance_of(fixture.asset(), fixture.controller()),
            make_amount(400));

  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, kVestingInitiatedEvent);
  EXPECT_EQ(find_attribute(result.events[0], "amount"),
            std::optional<std::string>{"600"});
  EXPECT_EQ(find_attribute(result.events[0], "maturity"),
            std::optional{std::to_string(kGenesisTime + kLockDuration)});
}

TEST(timelock, initiate_lock_rejects_non_controller_before_any_pull) {
  auto fixture = vault_fixture{"vestlock_timelock_unauthorized"};
  fund_controller(fixture, 1000);

  auto result = fixture.timelock().initiate_lock(
      fixture.stranger(), fixture.asset(), make_amount(100), kGenesisTime);

  EXPECT_EQ(result.error(), lock_error_code::not_authorized);
  EXPECT_EQ(fixture.ledger().pull_calls, 0);
  EXPECT_FALSE(fixture.timelock().maturity_of(fixture.asset()).has_value());
}

TEST(timelock, initiate_lock_checks_authorization_before_input) {
  auto fixture = vault_fixture{"vestlock_timelock_check_order"};

  auto result = fixture.timelock().initiate_lock(
      fixture.stranger(), make_zero_hash(), make_amount(0), kGenesisTime);

  EXPECT_EQ(result.error(), lock_error_code::not_authorized);
}

TEST(timelock, initiate_lock_rejects_null_asset_and_zero_amount) {
  auto fixture = vault_fixture{"vestlock_timelock_validation"};
  fund_controller(fixture, 1000);

  auto null_asset = fixture.timelock().initiate_lock(
      fixture.controller(), make_zero_hash(), make_amount(0), kGenesisTime);
  EXPECT_EQ(null_asset.error(), lock_error_code::invalid_asset);

  auto zero = lock(fixture, 0);
  EXPECT_EQ(zero.error(), lock_error_code::zero_amount);
  EXPECT_EQ(fixture.ledger().pull_calls, 0);
}

TEST(timelock, second_lock_on_same_asset_is_rejected) {
  auto fixture = vault_fixture{"vestlock_timelock_double_lock"};
  fund_controller(fixture, 1000);
  ASSERT_TRUE(lock(fixture, 300).ok());

  auto again = lock(fixture, 300, kGenesisTime + kOneDay);

  EXPECT_EQ(again.error(), lock_error_code::already_locked);
  EXPECT_EQ(fixture.ledger().pull_calls, 1);
  EXPECT_EQ(fixture.timelock().maturity_of(fixture.asset()),
            std::optional{kGenesisTime + kLockDuration});
  EXPECT_EQ(fixture.timelock().held_balance_of(fixture.asset()),
            make_amount(300));
}

TEST(timelock, other_assets_lock_independently) {
  auto fixture = vault_fixture{"vestlock_timelock_independent"};
  auto other = make_hash(51);
  fund_controller(fixture, 100);
  fixture.ledger().set_balance(other, fixture.controller(), make_amount(100));

  ASSERT_TRUE(lock(fixture, 100).ok());
  auto second = fixture.timelock().initiate_lock(
      fixture.controller(), other, make_amount(100), kGenesisTime + kOneDay);

  ASSERT_TRUE(second.ok());
  EXPECT_EQ(fixture.timelock().active_locks().size(), 2u);
  EXPECT_EQ(fixture.timelock().maturity_of(other),
            std::optional{kGenesisTime + kOneDay + kLockDuration});
}

TEST(timelock, unconfirmed_pull_leaves_no_lock) {
  struct case_t {
    vestlock::ledger::ledger_response response;
  };
  const auto cases = {
      case_t{{.reverted = true, .returned = std::nullopt}},
      case_t{{.reverted = false, .returned = false}},
      case_t{{.reverted = false, .returned = std::nullopt}},
  };
  for (const auto& c : cases) {
    auto fixture = vault_fixture{"vestlock_timelock_pull_failure"};
    fund_controller(fixture, 1000);
    fixture.ledger().pull_response = c.response;

    auto result = lock(fixture, 100);

    EXPECT_EQ(result.error(), lock_error_code::transfer_pull_failed);
    EXPECT_TRUE(result.events.empty());
    EXPECT_FALSE(fixture.timelock().maturity_of(fixture.asset()).has_value());
  }
}

TEST(timelock, pull_beyond_controller_balance_fails) {
  auto fixture = vault_fixture{"vestlock_timelock_short_balance"};
  fund_controller(fixture, 10);

  auto result = lock(fixture, 11);

  EXPECT_EQ(result.error(), lock_error_code::transfer_pull_failed);
  EXPECT_FALSE(fixture.timelock().maturity_of(fixture.asset()).has_value());
}

TEST(timelock, release_without_lock_is_not_vested) {
  auto fixture = vault_fixture{"vestlock_timelock_not_vested"};

  auto result = fixture.timelock().release(fixture.controller(),
                                           fixture.asset(), kGenesisTime);

  EXPECT_EQ(result.error(), lock_error_code::not_vested);
  EXPECT_EQ(fixture.ledger().push_calls, 0);
}

TEST(timelock, release_before_maturity_is_still_locked) {
  auto fixture = vault_fixture{"vestlock_timelock_still_locked"};
  fund_controller(fixture, 100);
  ASSERT_TRUE(lock(fixture, 100).ok());

  auto result = fixture.timelock().release(
      fixture.controller(), fixture.asset(), kGenesisTime + kLockDuration - 1);

  EXPECT_EQ(result.error(), lock_error_code::still_locked);
  EXPECT_EQ(fixture.ledger().push_calls, 0);
  EXPECT_TRUE(fixture.timelock().maturity_of(fixture.asset()).has_value());
  EXPECT_EQ(fixture.timelock().held_balance_of(fixture.asset()),
            make_amount(100));
}

TEST(timelock, release_at_maturity_sends_whole_balance) {
  auto fixture = vault_fixture{"vestlock_timelock_release"};
  fund_controller(fixture, 100);
  ASSERT_TRUE(lock(fixture, 100).ok());

  auto result = fixture.timelock().release(
      fixture.controller(), fixture.asset(), kGenesisTime + kLockDuration);

  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_FALSE(fixture.timelock().maturity_of(fixture.asset()).has_value());
  EXPECT_EQ(fixture.timelock().held_balance_of(fixture.asset()),
            make_amount(0));
  EXPECT_EQ(fixture.ledger().balance_of(fixture.asset(), fixture.controller()),
            make_amount(100));
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, kReleasedEvent);
}

TEST(timelock, release_includes_direct_deposits) {
  auto fixture = vault_fixture{"vestlock_timelock_deposits"};
  fund_controller(fixture, 100);
  ASSERT_TRUE(lock(fixture, 100).ok());
  // Sent straight to the vault, outside any lock call.
  fixture.ledger().set_balance(fixture.asset(), fixture.vault(),
                               make_amount(175));

  auto result = fixture.timelock().release(
      fixture.controller(), fixture.asset(), kGenesisTime + kLockDuration);

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(find_attribute(result.events[0], "amount"),
            std::optional<std::string>{"175"});
  EXPECT_EQ(fixture.ledger().balance_of(fixture.asset(), fixture.controller()),
            make_amount(175));
}

TEST(timelock, release_with_empty_vault_keeps_lock) {
  auto fixture = vault_fixture{"vestlock_timelock_nothing"};
  fund_controller(fixture, 100);
  ASSERT_TRUE(lock(fixture, 100).ok());
  fixture.ledger().set_balance(fixture.asset(), fixture.vault(),
                               make_amount(0));

  auto result = fixture.timelock().release(
      fixture.controller(), fixture.asset(), kGenesisTime + kLockDuration);

  EXPECT_EQ(result.error(), lock_error_code::nothing_to_release);
  EXPECT_TRUE(fixture.timelock().maturity_of(fixture.asset()).has_value());
  EXPECT_EQ(fixture.ledger().push_calls, 0);
}

TEST(timelock, release_rejects_non_controller_even_after_maturity) {
  auto fixture = vault_fixture{"vestlock_timelock_release_unauthorized"};
  fund_controller(fixture, 100);
  ASSERT_TRUE(lock(fixture, 100).ok());

  auto result = fixture.timelock().release(
      fixture.stranger(), fixture.asset(), kGenesisTime + 2 * kLockDuration);

  EXPECT_EQ(result.error(), lock_error_code::not_authorized);
  EXPECT_TRUE(fixture.timelock().maturity_of(fixture.asset()).has_value());
}

TEST(timelock, failed_push_reports_error_with_lock_already_cleared) {
  auto fixture = vault_fixture{"vestlock_timelock_push_failure"};
  fund_controller(fixture, 100);
  ASSERT_TRUE(lock(fixture, 100).ok());
  fixture.ledger().push_response =
      vestlock::ledger::ledger_response{.reverted = false, .returned = false};

  auto result = fixture.timelock().release(
      fixture.controller(), fixture.asset(), kGenesisTime + kLockDuration);

  EXPECT_EQ(result.error(), lock_error_code::transfer_push_failed);
  EXPECT_FALSE(fixture.timelock().maturity_of(fixture.asset()).has_value());
  EXPECT_EQ(fixture.timelock().held_balance_of(fixture.asset()),
            make_amount(100));

  // Recovery goes through a fresh cycle.
  fixture.ledger().push_response.reset();
  fund_controller(fixture, 1);
  auto relock = lock(fixture, 1, kGenesisTime + kLockDuration);
  ASSERT_TRUE(relock.ok());
  auto retry = fixture.timelock().release(fixture.controller(),
                                          fixture.asset(),
                                          kGenesisTime + 2 * kLockDuration);
  ASSERT_TRUE(retry.ok());
  EXPECT_EQ(fixture.ledger().balance_of(fixture.asset(), fixture.controller()),
            make_amount(101));
}

TEST(timelock, release_reentered_from_push_finds_no_lock) {
  auto fixture = vault_fixture{"vestlock_timelock_reentrant_release"};
  fund_controller(fixture, 100);
  ASSERT_TRUE(lock(fixture, 100).ok());
  const auto now = kGenesisTime + kLockDuration;

  auto nested = std::optional<command_result_t>{};
  fixture.ledger().on_push = [&] {
    nested = fixture.timelock().release(fixture.controller(), fixture.asset(),
                                        now);
  };

  auto result = fixture.timelock().release(fixture.controller(),
                                           fixture.asset(), now);

  ASSERT_TRUE(result.ok());
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(nested->error(), lock_error_code::not_vested);
  EXPECT_EQ(fixture.ledger().push_calls, 1);
  EXPECT_EQ(fixture.ledger().balance_of(fixture.asset(), fixture.controller()),
            make_amount(100));
}

TEST(timelock, lock_started_inside_pull_does_not_fail_outer_call) {
  auto fixture = vault_fixture{"vestlock_timelock_reentrant_lock"};
  fund_controller(fixture, 100);

  auto nested = std::optional<command_result_t>{};
  fixture.ledger().on_pull = [&] { nested = lock(fixture, 40); };

  auto result = lock(fixture, 50);

  ASSERT_TRUE(nested.has_value());
  EXPECT_TRUE(nested->ok());
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(find_attribute(result.events[0], "amount"),
            std::optional<std::string>{"50"});
  EXPECT_EQ(fixture.timelock().active_locks().size(), 1u);
  EXPECT_EQ(fixture.timelock().maturity_of(fixture.asset()),
            std::optional{kGenesisTime + kLockDuration});
  EXPECT_EQ(fixture.timelock().held_balance_of(fixture.asset()),
            make_amount(90));
}

TEST(timelock, rejects_lock_whose_maturity_overflows_the_clock) {
  auto fixture = vault_fixture{"vestlock_timelock_clock_overflow"};
  fund_controller(fixture, 100);
  constexpr auto kClockMax =
      std::numeric_limits<timestamp_milliseconds_t>::max();
  const auto now = kClockMax - 1000;

  EXPECT_EQ(lock(fixture, 100, now).error(),
            lock_error_code::invalid_timestamp);
  EXPECT_EQ(fixture.ledger().pull_calls, 0);
  EXPECT_FALSE(fixture.timelock().maturity_of(fixture.asset()).has_value());
  EXPECT_EQ(fixture.timelock()
                .release(fixture.controller(), fixture.asset(), now)
                .error(),
            lock_error_code::not_vested);

  const auto latest = kClockMax - kLockDuration;
  ASSERT_TRUE(lock(fixture, 100, latest).ok());
  EXPECT_EQ(fixture.timelock().maturity_of(fixture.asset()),
            std::optional{kClockMax});
  EXPECT_EQ(fixture.timelock()
                .release(fixture.controller(), fixture.asset(), latest)
                .error(),
            lock_error_code::still_locked);
}

TEST(timelock, released_asset_can_be_locked_again) {
  auto fixture = vault_fixture{"vestlock_timelock_relock"};
  fund_controller(fixture, 100);
  ASSERT_TRUE(lock(fixture, 100).ok());
  const auto released_at = kGenesisTime + kLockDuration + kOneDay;
  ASSERT_TRUE(fixture.timelock()
                  .release(fixture.controller(), fixture.asset(), released_at)
                  .ok());

  auto relock = lock(fixture, 30, released_at);

  ASSERT_TRUE(relock.ok());
  EXPECT_EQ(fixture.timelock().maturity_of(fixture.asset()),
            std::optional{released_at + kLockDuration});
}

TEST(timelock, sweep_native_sends_everything_to_controller) {
  auto fixture = vault_fixture{"vestlock_timelock_sweep"};
  fixture.ledger().set_native_balance(fixture.vault(), make_amount(77));

  auto result = fixture.timelock().sweep_native(fixture.controller());

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(fixture.ledger().native_balance_of(fixture.controller()),
            make_amount(77));
  EXPECT_EQ(fixture.ledger().native_balance_of(fixture.vault()),
            make_amount(0));
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, kNativeWithdrawnEvent);
}

TEST(timelock, sweep_native_failure_modes) {
  auto fixture = vault_fixture{"vestlock_timelock_sweep_failures"};

  EXPECT_EQ(fixture.timelock().sweep_native(fixture.controller()).error(),
            lock_error_code::nothing_to_release);

  fixture.ledger().set_native_balance(fixture.vault(), make_amount(5));
  EXPECT_EQ(fixture.timelock().sweep_native(fixture.stranger()).error(),
            lock_error_code::not_authorized);

  fixture.ledger().native_response =
      vestlock::ledger::ledger_response{.reverted = true,
                                        .returned = std::nullopt};
  EXPECT_EQ(fixture.timelock().sweep_native(fixture.controller()).error(),
            lock_error_code::transfer_push_failed);
  EXPECT_EQ(fixture.ledger().native_balance_of(fixture.vault()),
            make_amount(5));
}

TEST(timelock, renounced_vault_rejects_every_operation) {
  auto fixture = vault_fixture{"vestlock_timelock_renounced"};
  fund_controller(fixture, 100);
  ASSERT_TRUE(lock(fixture, 100).ok());
  ASSERT_TRUE(fixture.guard().renounce_control(fixture.controller()).ok());
  const auto later = kGenesisTime + 2 * kLockDuration;

  EXPECT_EQ(lock(fixture, 1, later).error(), lock_error_code::not_authorized);
  EXPECT_EQ(fixture.timelock()
                .release(fixture.controller(), fixture.asset(), later)
                .error(),
            lock_error_code::not_authorized);
  EXPECT_EQ(fixture.timelock().sweep_native(fixture.controller()).error(),
            lock_error_code::not_authorized);
  EXPECT_FALSE(fixture.timelock().current_controller().has_value());
}

TEST(timelock, full_cycle_scenario) {
  auto fixture = vault_fixture{"vestlock_timelock_scenario"};
  fund_controller(fixture, 1000);
  auto now = kGenesisTime;

  ASSERT_TRUE(lock(fixture, 1000, now).ok());
  now += 10 * kOneDay;
  // Direct deposit straight into the vault.
  fixture.ledger().set_balance(fixture.asset(), fixture.vault(),
                               make_amount(1250));
  EXPECT_EQ(fixture.timelock().held_balance_of(fixture.asset()),
            make_amount(1250));
  now = kGenesisTime + 100 * kOneDay;
  EXPECT_EQ(fixture.timelock()
                .release(fixture.controller(), fixture.asset(), now)
                .error(),
            lock_error_code::still_locked);
  EXPECT_EQ(lock(fixture, 1, now).error(), lock_error_code::already_locked);

  now = kGenesisTime + 183 * kOneDay;
  auto released =
      fixture.timelock().release(fixture.controller(), fixture.asset(), now);
  ASSERT_TRUE(released.ok());
  ASSERT_EQ(released.events.size(), 1u);
  EXPECT_EQ(find_attribute(released.events[0], "amount"),
            std::optional<std::string>{"1250"});
  EXPECT_EQ(fixture.ledger().balance_of(fixture.asset(), fixture.controller()),
            make_amount(1250));
  EXPECT_EQ(fixture.timelock().held_balance_of(fixture.asset()),
            make_amount(0));

  EXPECT_EQ(fixture.timelock()
                .release(fixture.controller(), fixture.asset(), now)
                .error(),
            lock_error_code::not_vested);
  EXPECT_TRUE(fixture.timelock().active_locks().empty());
}
