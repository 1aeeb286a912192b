#pragma once

#include <vestlock/schema/primitives.hpp>
#include <array>
#include <string_view>

// Schema key type: engine keys.
// Canonical prefixes for every keyspace the vault writes to RocksDB.
namespace vestlock::schema::key {

inline constexpr std::string_view kLockKeyPrefix{"SYS|STATE|LOCK|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kControllerKey{"SYS|ACCESS|CONTROLLER"};
inline constexpr std::string_view kEngineStateKey{"SYS|APP|STATE"};
inline constexpr std::string_view kLedgerBalancePrefix{"LEDGER|BALANCE|"};
inline constexpr std::string_view kLedgerNativePrefix{"LEDGER|NATIVE|"};

inline constexpr std::array<std::string_view, 6> kEngineKeyspaces{
    kLockKeyPrefix,      kNonceKeyPrefix,      kControllerKey,
    kEngineStateKey,     kLedgerBalancePrefix, kLedgerNativePrefix};

bytes_t make_lock_key(const asset_id_t& asset);
bytes_t make_nonce_key(const signer_id_t& signer);
bytes_t make_balance_key(const asset_id_t& asset, const account_id_t& holder);
bytes_t make_native_balance_key(const account_id_t& holder);

}  // namespace vestlock::schema::key
