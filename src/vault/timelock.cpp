#include <spdlog/spdlog.h>
#include <vestlock/vault/timelock.hpp>

#include <limits>
#include <string>
#include <utility>

using namespace vestlock::schema;

namespace vestlock::vault {

namespace {

constexpr auto kCodespace = "vestlock.vault";

command_result_t reject(const std::string_view operation,
                        const lock_error_code code,
                        std::string log) {
  spdlog::warn("{} rejected: {} ({})", operation, log,
               vestlock::schema::to_string(code));
  return command_result_t{.code = static_cast<uint32_t>(code),
                          .log = std::move(log),
                          .codespace = kCodespace};
}

command_result_t accept(lock_event_t event) {
  auto result = command_result_t{.codespace = kCodespace};
  result.events.push_back(std::move(event));
  return result;
}

}  // namespace

timelock::timelock(lock_registry& registry,
                   vestlock::access::guard& guard,
                   vestlock::ledger::adapter& adapter)
    : registry_{registry}, guard_{guard}, adapter_{adapter} {}

command_result_t timelock::initiate_lock(const account_id_t& caller,
                                         const asset_id_t& asset,
                                         const amount_t& amount,
                                         const timestamp_milliseconds_t now) {
  constexpr auto kOperation = std::string_view{"initiate_lock"};
  if (!guard_.authorize(caller)) {
    return reject(kOperation, lock_error_code::not_authorized,
                  "caller is not the controller");
  }
  if (is_zero(asset)) {
    return reject(kOperation, lock_error_code::invalid_asset,
                  "asset must not be the null id");
  }
  if (amount == 0) {
    return reject(kOperation, lock_error_code::zero_amount,
                  "amount must be positive");
  }
  if (registry_.get(asset).has_value()) {
    return reject(kOperation, lock_error_code::already_locked,
                  "asset already has an active lock");
  }
  if (now > std::numeric_limits<timestamp_milliseconds_t>::max() -
                kLockDuration) {
    return reject(kOperation, lock_error_code::invalid_timestamp,
                  "maturity would overflow the clock");
  }

  if (!vestlock::ledger::succeeded(
          adapter_.pull(asset, caller, adapter_.vault(), amount))) {
    return reject(kOperation, lock_error_code::transfer_pull_failed,
                  "ledger did not confirm the pull");
  }

  const auto maturity = now + kLockDuration;
  auto record = lock_record_t{.asset = asset,
                              .maturity = maturity,
                              .locked_at = now,
                              .last_amount = amount};
  // The pull has moved funds, so the record is written even when a lock was
  // started from inside the pull. Both ran at `now` and share the maturity.
  registry_.put(record);

  spdlog::info("Locked {} of asset {} until {}",
               vestlock::schema::to_string(amount), to_hex(asset), maturity);
  return accept(make_vesting_initiated_event(asset, amount, maturity));
}

command_result_t timelock::release(const account_id_t& caller,
                                   const asset_id_t& asset,
                                   const timestamp_milliseconds_t now) {
  constexpr auto kOperation = std::string_view{"release"};

  // Phase one: every check and the registry clear. Nothing after this block
  // reads or writes the registry.
  auto amount = amount_t{};
  {
    if (!guard_.authorize(caller)) {
      return reject(kOperation, lock_error_code::not_authorized,
                    "caller is not the controller");
    }
    if (is_zero(asset)) {
      return reject(kOperation, lock_error_code::invalid_asset,
                    "asset must not be the null id");
    }
    auto maturity = registry_.get(asset);
    if (!maturity.has_value()) {
      return reject(kOperation, lock_error_code::not_vested,
                    "asset has no active lock");
    }
    if (now < maturity.value()) {
      return reject(kOperation, lock_error_code::still_locked,
                    "lock matures at " + std::to_string(maturity.value()));
    }
    amount = adapter_.balance_of(asset, adapter_.vault());
    if (amount == 0) {
      return reject(kOperation, lock_error_code::nothing_to_release,
                    "vault holds none of the asset");
    }
    registry_.clear(asset);
  }

  // Phase two: the external transfer.
  if (!vestlock::ledger::succeeded(adapter_.push(asset, caller, amount))) {
    spdlog::error(
        "Push of {} of asset {} failed after its lock was cleared; funds stay "
        "in the vault unlocked",
        vestlock::schema::to_string(amount), to_hex(asset));
    return reject(kOperation, lock_error_code::transfer_push_failed,
                  "ledger did not confirm the push");
  }

  spdlog::info("Released {} of asset {}", vestlock::schema::to_string(amount),
               to_hex(asset));
  return accept(make_released_event(asset, amount));
}

command_result_t timelock::sweep_native(const account_id_t& caller) {
  constexpr auto kOperation = std::string_view{"sweep_native"};
  if (!guard_.authorize(caller)) {
    return reject(kOperation, lock_error_code::not_authorized,
                  "caller is not the controller");
  }
  auto amount = adapter_.native_balance_of(adapter_.vault());
  if (amount == 0) {
    return reject(kOperation, lock_error_code::nothing_to_release,
                  "vault holds no native currency");
  }
  if (!vestlock::ledger::succeeded(adapter_.push_native(caller, amount))) {
    return reject(kOperation, lock_error_code::transfer_push_failed,
                  "ledger did not confirm the native push");
  }
  spdlog::info("Swept {} native to {}", vestlock::schema::to_string(amount),
               to_hex(caller));
  return accept(make_native_withdrawn_event(caller, amount));
}

std::optional<timestamp_milliseconds_t> timelock::maturity_of(
    const asset_id_t& asset) const {
  return registry_.get(asset);
}

amount_t timelock::held_balance_of(const asset_id_t& asset) const {
  return adapter_.balance_of(asset, adapter_.vault());
}

std::optional<account_id_t> timelock::current_controller() const {
  return guard_.controller();
}

std::vector<lock_record_t> timelock::active_locks() const {
  return registry_.list();
}

}  // namespace vestlock::vault
