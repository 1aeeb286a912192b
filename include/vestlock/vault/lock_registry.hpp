#pragma once

#include <vestlock/schema/encoding/scale/encoder.hpp>
#include <vestlock/schema/lock_error_code.hpp>
#include <vestlock/schema/lock_record.hpp>
#include <vestlock/storage/rocksdb/storage.hpp>
#include <optional>
#include <vector>

namespace vestlock::vault {

// Keyed `SYS|STATE|LOCK|<asset>`. Timing only; balances come from the ledger.
class lock_registry final {
 public:
  explicit lock_registry(
      vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag>&
          storage);

  std::optional<vestlock::schema::timestamp_milliseconds_t> get(
      const vestlock::schema::asset_id_t& asset) const;

  std::optional<vestlock::schema::lock_record_t> find(
      const vestlock::schema::asset_id_t& asset) const;

  /// Write `record`. Fails with `already_locked` when the stored maturity for
  /// the asset is still ahead of `now`.
  vestlock::schema::lock_error_code set(
      const vestlock::schema::lock_record_t& record,
      vestlock::schema::timestamp_milliseconds_t now);

  // Unconditional write.
  void put(const vestlock::schema::lock_record_t& record);

  void clear(const vestlock::schema::asset_id_t& asset);

  std::vector<vestlock::schema::lock_record_t> list() const;

 private:
  vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag>&
      storage_;
  mutable vestlock::schema::encoding::encoder<
      vestlock::schema::encoding::scale_encoder_tag>
      encoder_;
};

}  // namespace vestlock::vault
