#pragma once

#include <vestlock/access/guard.hpp>
#include <vestlock/ledger/adapter.hpp>
#include <vestlock/schema/command_result.hpp>
#include <vestlock/schema/lock_record.hpp>
#include <vestlock/schema/primitives.hpp>
#include <vestlock/vault/lock_registry.hpp>
#include <optional>
#include <vector>

namespace vestlock::vault {

/// Fixed maturity period of every lock cycle: 182 days.
inline constexpr vestlock::schema::duration_milliseconds_t kLockDuration =
    182ULL * 24 * 60 * 60 * 1000;

/// Lock state machine of the custodial timelock.
///
/// Every mutating call runs its checks in a fixed order and reports the first
/// failure; a rejected call leaves registry and ledger untouched. Release is
/// split in two phases: the registry is cleared before the ledger push
/// starts, so a release re-entered from inside the push finds no maturity.
class timelock final {
 public:
  timelock(lock_registry& registry,
           vestlock::access::guard& guard,
           vestlock::ledger::adapter& adapter);

  /// Pull `amount` of `asset` from the controller and start a lock cycle that
  /// matures at `now + kLockDuration`.
  ///
  /// Whatever the vault already holds of `asset` joins the cycle; nothing
  /// about existing balances is recorded.
  vestlock::schema::command_result_t initiate_lock(
      const vestlock::schema::account_id_t& caller,
      const vestlock::schema::asset_id_t& asset,
      const vestlock::schema::amount_t& amount,
      vestlock::schema::timestamp_milliseconds_t now);

  /// Send the entire vault balance of a matured asset to the controller.
  ///
  /// A push that is not confirmed reports `transfer_push_failed` with the
  /// lock already cleared; the funds stay in the vault unlocked until a new
  /// cycle is started and matures.
  vestlock::schema::command_result_t release(
      const vestlock::schema::account_id_t& caller,
      const vestlock::schema::asset_id_t& asset,
      vestlock::schema::timestamp_milliseconds_t now);

  /// Send all native currency held by the vault to the controller.
  vestlock::schema::command_result_t sweep_native(
      const vestlock::schema::account_id_t& caller);

  std::optional<vestlock::schema::timestamp_milliseconds_t> maturity_of(
      const vestlock::schema::asset_id_t& asset) const;

  vestlock::schema::amount_t held_balance_of(
      const vestlock::schema::asset_id_t& asset) const;

  std::optional<vestlock::schema::account_id_t> current_controller() const;

  static constexpr vestlock::schema::duration_milliseconds_t lock_duration() {
    return kLockDuration;
  }

  std::vector<vestlock::schema::lock_record_t> active_locks() const;

 private:
  lock_registry& registry_;
  vestlock::access::guard& guard_;
  vestlock::ledger::adapter& adapter_;
};

}  // namespace vestlock::vault
