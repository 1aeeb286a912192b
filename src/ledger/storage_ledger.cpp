#include <spdlog/spdlog.h>
#include <vestlock/ledger/storage_ledger.hpp>
#include <vestlock/schema/key/engine_keys.hpp>

#include <limits>
#include <optional>

using namespace vestlock::schema;

namespace {

std::optional<amount_t> checked_add(const amount_t& balance,
                                    const amount_t& amount) {
  if (balance > std::numeric_limits<amount_t>::max() - amount) {
    return std::nullopt;
  }
  return amount_t{balance + amount};
}

}  // namespace

namespace vestlock::ledger {

storage_ledger::storage_ledger(
    vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag>&
        storage,
    const account_id_t& vault)
    : storage_{storage}, vault_{vault} {}

amount_t storage_ledger::balance_of(const asset_id_t& asset,
                                    const account_id_t& holder) const {
  return load(key::make_balance_key(asset, holder));
}

amount_t storage_ledger::native_balance_of(const account_id_t& holder) const {
  return load(key::make_native_balance_key(holder));
}

const account_id_t& storage_ledger::vault() const {
  return vault_;
}

bool storage_ledger::credit(const asset_id_t& asset,
                            const account_id_t& holder,
                            const amount_t& amount) {
  auto balance_key = key::make_balance_key(asset, holder);
  auto balance = checked_add(load(balance_key), amount);
  if (!balance.has_value()) {
    spdlog::warn("Ledger credit of {} of asset {} to {} would overflow",
                 vestlock::schema::to_string(amount), to_hex(asset),
                 to_hex(holder));
    return false;
  }
  store(balance_key, *balance);
  spdlog::info("Ledger credited {} of asset {} to {}",
               vestlock::schema::to_string(amount), to_hex(asset),
               to_hex(holder));
  return true;
}

bool storage_ledger::credit_native(const account_id_t& holder,
                                   const amount_t& amount) {
  auto balance_key = key::make_native_balance_key(holder);
  auto balance = checked_add(load(balance_key), amount);
  if (!balance.has_value()) {
    spdlog::warn("Ledger native credit of {} to {} would overflow",
                 vestlock::schema::to_string(amount), to_hex(holder));
    return false;
  }
  store(balance_key, *balance);
  spdlog::info("Ledger credited {} native to {}",
               vestlock::schema::to_string(amount), to_hex(holder));
  return true;
}

ledger_response storage_ledger::move(const asset_id_t& asset,
                                     const account_id_t& from,
                                     const account_id_t& to,
                                     const amount_t& amount) {
  return move_between(key::make_balance_key(asset, from),
                      key::make_balance_key(asset, to), amount);
}

ledger_response storage_ledger::transfer_from(const asset_id_t& asset,
                                              const account_id_t& from,
                                              const account_id_t& to,
                                              const amount_t& amount) {
  return move(asset, from, to, amount);
}

ledger_response storage_ledger::transfer(const asset_id_t& asset,
                                         const account_id_t& to,
                                         const amount_t& amount) {
  return move(asset, vault_, to, amount);
}

ledger_response storage_ledger::send_native(const account_id_t& to,
                                            const amount_t& amount) {
  return move_between(key::make_native_balance_key(vault_),
                      key::make_native_balance_key(to), amount);
}

amount_t storage_ledger::load(const bytes_t& key) const {
  return storage_.get<amount_t>(encoder_, key).value_or(amount_t{0});
}

void storage_ledger::store(const bytes_t& key, const amount_t& amount) {
  if (amount == 0) {
    storage_.erase(key);
    return;
  }
  storage_.put(encoder_, key, amount);
}

ledger_response storage_ledger::move_between(const bytes_t& from_key,
                                             const bytes_t& to_key,
                                             const amount_t& amount) {
  auto from_balance = load(from_key);
  if (from_balance < amount) {
    return ledger_response{.reverted = true, .returned = std::nullopt};
  }
  if (from_key == to_key) {
    return ledger_response{.reverted = false, .returned = true};
  }
  auto to_balance = checked_add(load(to_key), amount);
  if (!to_balance.has_value()) {
    return ledger_response{.reverted = true, .returned = std::nullopt};
  }
  store(from_key, from_balance - amount);
  store(to_key, *to_balance);
  return ledger_response{.reverted = false, .returned = true};
}

}  // namespace vestlock::ledger
