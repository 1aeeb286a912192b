#pragma once

#include <vestlock/access/guard.hpp>
#include <vestlock/execution/signature_verifier.hpp>
#include <vestlock/ledger/adapter.hpp>
#include <vestlock/schema/command.hpp>
#include <vestlock/schema/command_result.hpp>
#include <vestlock/schema/encoding/scale/encoder.hpp>
#include <vestlock/schema/primitives.hpp>
#include <vestlock/schema/query_result.hpp>
#include <vestlock/storage/rocksdb/storage.hpp>
#include <vestlock/vault/lock_registry.hpp>
#include <vestlock/vault/timelock.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

namespace vestlock::execution {

/// Bytes a signer signs: SCALE of (version, chain_id, nonce, signer, payload).
vestlock::schema::bytes_t make_signing_bytes(
    const vestlock::schema::command_t& command);

/// Command front end of the vault.
///
/// The engine decodes signed command envelopes, checks chain id, nonce and
/// signature, resolves the signer to an account id and hands the payload to
/// the timelock or the access guard. After every accepted envelope it
/// recomputes the state root and persists it with the command sequence.
class engine final {
 public:
  /// `require_strict_crypto` enables real signature verification; when false
  /// signatures are not checked at all.
  engine(vestlock::schema::encoding::encoder<
             vestlock::schema::encoding::scale_encoder_tag>& encoder,
         vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag>&
             storage,
         vestlock::ledger::adapter& adapter,
         const vestlock::schema::hash32_t& chain_id,
         bool require_strict_crypto = true);

  /// Decode and validate an envelope without mutating state.
  vestlock::schema::command_result_t check_command(
      const vestlock::schema::bytes_view_t& raw_command);

  /// Validate, consume the nonce and execute the payload at `now`.
  vestlock::schema::command_result_t execute_command(
      const vestlock::schema::bytes_view_t& raw_command,
      vestlock::schema::timestamp_milliseconds_t now);

  /// Assign the first controller of a fresh vault.
  vestlock::schema::command_result_t bootstrap(
      const vestlock::schema::account_id_t& controller);

  /// Read-only lookup by route.
  vestlock::schema::query_result_t query(
      std::string_view path,
      const vestlock::schema::bytes_view_t& data);

  vestlock::storage::committed_state info() const;

  const vestlock::schema::hash32_t& chain_id() const;

  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  /// State machine the engine dispatches to. Ledger callbacks that re-enter
  /// the vault go through here rather than through the engine.
  vestlock::vault::timelock& timelock();

 private:
  vestlock::schema::command_result_t validate_command(
      const vestlock::schema::command_t& command,
      std::string_view codespace) const;

  vestlock::schema::command_result_t execute_payload(
      const vestlock::schema::command_t& command,
      vestlock::schema::timestamp_milliseconds_t now);

  uint64_t last_nonce(const vestlock::schema::signer_id_t& signer) const;
  vestlock::schema::hash32_t compute_state_root() const;
  void commit();

  mutable std::mutex mutex_;
  vestlock::schema::encoding::encoder<
      vestlock::schema::encoding::scale_encoder_tag>& encoder_;
  vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag>&
      storage_;
  vestlock::vault::lock_registry registry_;
  vestlock::access::guard guard_;
  vestlock::vault::timelock timelock_;
  vestlock::schema::hash32_t chain_id_;
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
  vestlock::storage::committed_state committed_;
};

}  // namespace vestlock::execution
