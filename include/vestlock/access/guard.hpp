#pragma once

#include <vestlock/schema/command_result.hpp>
#include <vestlock/schema/encoding/scale/encoder.hpp>
#include <vestlock/schema/primitives.hpp>
#include <vestlock/storage/rocksdb/storage.hpp>
#include <optional>

namespace vestlock::access {

/// Single-controller authorization for every mutating vault operation.
///
/// The controller is persisted under `SYS|ACCESS|CONTROLLER` as an optional
/// id: a missing key means no controller was ever assigned, a stored empty
/// optional means control was renounced. Once renounced, `authorize` is false
/// for every caller and nothing can assign a controller again.
class guard final {
 public:
  explicit guard(
      vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag>&
          storage);

  bool authorize(const vestlock::schema::account_id_t& caller) const;

  std::optional<vestlock::schema::account_id_t> controller() const;
  bool renounced() const;

  vestlock::schema::command_result_t bootstrap(
      const vestlock::schema::account_id_t& controller);

  vestlock::schema::command_result_t transfer_control(
      const vestlock::schema::account_id_t& caller,
      const vestlock::schema::account_id_t& new_controller);

  vestlock::schema::command_result_t renounce_control(
      const vestlock::schema::account_id_t& caller);

 private:
  std::optional<std::optional<vestlock::schema::account_id_t>> load() const;
  void store(const std::optional<vestlock::schema::account_id_t>& controller);

  vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag>&
      storage_;
  mutable vestlock::schema::encoding::encoder<
      vestlock::schema::encoding::scale_encoder_tag>
      encoder_;
};

}  // namespace vestlock::access
