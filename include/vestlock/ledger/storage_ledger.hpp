#pragma once

#include <vestlock/ledger/adapter.hpp>
#include <vestlock/schema/encoding/scale/encoder.hpp>
#include <vestlock/storage/rocksdb/storage.hpp>

namespace vestlock::ledger {

/// Reference fungible ledger kept in the vault's own RocksDB store.
///
/// Balances live under `LEDGER|BALANCE|<asset>|<holder>` and native balances
/// under `LEDGER|NATIVE|<holder>`. Transfers that would overdraw the sender
/// or overflow the recipient revert; successful transfers return an explicit
/// `true`.
class storage_ledger final : public adapter {
 public:
  storage_ledger(
      vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag>&
          storage,
      const vestlock::schema::account_id_t& vault);

  vestlock::schema::amount_t balance_of(
      const vestlock::schema::asset_id_t& asset,
      const vestlock::schema::account_id_t& holder) const override;

  vestlock::schema::amount_t native_balance_of(
      const vestlock::schema::account_id_t& holder) const override;

  const vestlock::schema::account_id_t& vault() const override;

  /// Create units out of thin air for `holder` (funding for local use).
  /// Returns false, leaving the balance as it was, when it would overflow.
  bool credit(const vestlock::schema::asset_id_t& asset,
              const vestlock::schema::account_id_t& holder,
              const vestlock::schema::amount_t& amount);

  bool credit_native(const vestlock::schema::account_id_t& holder,
                     const vestlock::schema::amount_t& amount);

  ledger_response move(const vestlock::schema::asset_id_t& asset,
                       const vestlock::schema::account_id_t& from,
                       const vestlock::schema::account_id_t& to,
                       const vestlock::schema::amount_t& amount);

 protected:
  ledger_response transfer_from(
      const vestlock::schema::asset_id_t& asset,
      const vestlock::schema::account_id_t& from,
      const vestlock::schema::account_id_t& to,
      const vestlock::schema::amount_t& amount) override;

  ledger_response transfer(const vestlock::schema::asset_id_t& asset,
                           const vestlock::schema::account_id_t& to,
                           const vestlock::schema::amount_t& amount) override;

  ledger_response send_native(
      const vestlock::schema::account_id_t& to,
      const vestlock::schema::amount_t& amount) override;

 private:
  vestlock::schema::amount_t load(const vestlock::schema::bytes_t& key) const;
  void store(const vestlock::schema::bytes_t& key,
             const vestlock::schema::amount_t& amount);
  ledger_response move_between(const vestlock::schema::bytes_t& from_key,
                               const vestlock::schema::bytes_t& to_key,
                               const vestlock::schema::amount_t& amount);

  vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag>&
      storage_;
  mutable vestlock::schema::encoding::encoder<
      vestlock::schema::encoding::scale_encoder_tag>
      encoder_;
  vestlock::schema::account_id_t vault_;
};

}  // namespace vestlock::ledger
