#include <spdlog/spdlog.h>
#include <vestlock/access/identity.hpp>
#include <vestlock/blake3/hash.hpp>
#include <vestlock/crypto/verify.hpp>
#include <vestlock/execution/engine.hpp>
#include <vestlock/schema/key/engine_keys.hpp>
#include <algorithm>
#include <string>
#include <tuple>
#include <utility>

using namespace vestlock::schema;

namespace {

constexpr auto kCheckCodespace = std::string_view{"vestlock.check"};
constexpr auto kExecuteCodespace = std::string_view{"vestlock.engine"};
constexpr auto kQueryCodespace = std::string_view{"vestlock.query"};

command_result_t make_error(const lock_error_code code,
                            std::string log,
                            std::string info,
                            const std::string_view codespace) {
  return command_result_t{.code = static_cast<uint32_t>(code),
                          .log = std::move(log),
                          .info = std::move(info),
                          .codespace = std::string{codespace}};
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key) {
  return query_result_t{.code = static_cast<uint32_t>(code),
                        .log = std::move(log),
                        .key = make_bytes(key),
                        .codespace = std::string{kQueryCodespace}};
}

bool signature_matches_signer(const signer_id_t& signer,
                              const signature_t& signature) {
  if (std::holds_alternative<ed25519_signer_id>(signer)) {
    return std::holds_alternative<ed25519_signature_t>(signature);
  }
  if (std::holds_alternative<secp256k1_signer_id>(signer)) {
    return std::holds_alternative<secp256k1_signature_t>(signature);
  }
  return true;
}

std::optional<asset_id_t> read_asset(const bytes_view_t& data) {
  if (data.size() != 32) {
    return std::nullopt;
  }
  auto asset = asset_id_t{};
  std::copy(std::begin(data), std::end(data), std::begin(asset));
  return asset;
}

}  // namespace

namespace vestlock::execution {

bytes_t make_signing_bytes(const command_t& command) {
  auto encoder = encoding::encoder<encoding::scale_encoder_tag>{};
  return encoder.encode(std::tuple{command.version, command.chain_id,
                                   command.nonce, command.signer,
                                   command.payload});
}

engine::engine(
    encoding::encoder<encoding::scale_encoder_tag>& encoder,
    vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag>&
        storage,
    vestlock::ledger::adapter& adapter,
    const hash32_t& chain_id,
    const bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      registry_{storage},
      guard_{storage},
      timelock_{registry_, guard_, adapter},
      chain_id_{chain_id},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{vestlock::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_ && !vestlock::crypto::available()) {
    spdlog::warn("OpenSSL lacks ed25519 or secp256k1; signatures will fail");
  }
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; command signatures are not checked");
  }
  if (auto committed = storage_.load_committed_state()) {
    committed_ = *committed;
  } else {
    committed_ = vestlock::storage::committed_state{
        .sequence = 0, .state_root = compute_state_root()};
    storage_.save_committed_state(committed_);
  }
  spdlog::info("Engine ready at sequence {} with state root {}",
               committed_.sequence, to_hex(committed_.state_root));
}

command_result_t engine::check_command(const bytes_view_t& raw_command) {
  auto lock = std::scoped_lock{mutex_};
  auto command = encoder_.try_decode<command_t>(raw_command);
  if (!command.has_value()) {
    return make_error(lock_error_code::invalid_command, "invalid command",
                      "could not decode command envelope", kCheckCodespace);
  }
  return validate_command(*command, kCheckCodespace);
}

command_result_t engine::execute_command(const bytes_view_t& raw_command,
                                         const timestamp_milliseconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto command = encoder_.try_decode<command_t>(raw_command);
  if (!command.has_value()) {
    return make_error(lock_error_code::invalid_command, "invalid command",
                      "could not decode command envelope", kExecuteCodespace);
  }
  auto validation = validate_command(*command, kExecuteCodespace);
  if (!validation.ok()) {
    return validation;
  }

  // A validated envelope consumes its nonce whatever the payload outcome.
  storage_.put(encoder_, key::make_nonce_key(command->signer), command->nonce);

  auto result = execute_payload(*command, now);
  commit();
  return result;
}

command_result_t engine::bootstrap(const account_id_t& controller) {
  auto lock = std::scoped_lock{mutex_};
  auto result = guard_.bootstrap(controller);
  if (result.ok()) {
    commit();
  }
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{.key = make_bytes(data),
                               .codespace = std::string{kQueryCodespace}};

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        committed_.sequence, committed_.state_root, chain_id_});
    return result;
  }
  if (path == "/lock/duration") {
    result.value = encoder_.encode(vestlock::vault::timelock::lock_duration());
    return result;
  }
  if (path == "/lock/list") {
    result.value = encoder_.encode(timelock_.active_locks());
    return result;
  }
  if (path == "/access/controller") {
    result.value = encoder_.encode(timelock_.current_controller());
    return result;
  }
  if (path == "/lock/maturity" || path == "/lock/balance") {
    auto asset = read_asset(data);
    if (!asset.has_value()) {
      return make_query_error(query_error_code::invalid_key,
                              "expected 32-byte asset id", data);
    }
    if (path == "/lock/maturity") {
      result.value = encoder_.encode(timelock_.maturity_of(*asset));
    } else {
      result.value = encoder_.encode(timelock_.held_balance_of(*asset));
    }
    return result;
  }
  if (path == "/nonce") {
    auto signer = encoder_.try_decode<signer_id_t>(data);
    if (!signer.has_value()) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE-encoded signer id", data);
    }
    result.value = encoder_.encode(last_nonce(*signer));
    return result;
  }

  spdlog::debug("Unsupported query path '{}'", path);
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported path", data);
}

vestlock::storage::committed_state engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_;
}

const hash32_t& engine::chain_id() const {
  return chain_id_;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::debug("Ignoring signature verifier: strict crypto disabled");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

vestlock::vault::timelock& engine::timelock() {
  return timelock_;
}

command_result_t engine::validate_command(const command_t& command,
                                          const std::string_view codespace)
    const {
  if (command.version != 1) {
    return make_error(lock_error_code::unsupported_version,
                      "unsupported command version", "expected version 1",
                      codespace);
  }
  if (command.chain_id != chain_id_) {
    return make_error(lock_error_code::invalid_chain_id, "invalid chain id",
                      "command targets " + to_hex(command.chain_id),
                      codespace);
  }
  auto expected_nonce = last_nonce(command.signer) + 1;
  if (command.nonce != expected_nonce) {
    return make_error(lock_error_code::invalid_nonce, "invalid nonce",
                      "expected nonce " + std::to_string(expected_nonce),
                      codespace);
  }
  if (!require_strict_crypto_) {
    return command_result_t{.codespace = std::string{codespace}};
  }
  if (!signature_matches_signer(command.signer, command.signature)) {
    return make_error(lock_error_code::invalid_signature_type,
                      "signature type does not match signer", "", codespace);
  }
  auto message = make_signing_bytes(command);
  if (!signature_verifier_ ||
      !signature_verifier_(make_bytes_view(message), command.signer,
                           command.signature)) {
    spdlog::warn("Signature verification failed at nonce {}", command.nonce);
    return make_error(lock_error_code::signature_verification_failed,
                      "signature verification failed", "", codespace);
  }
  return command_result_t{.codespace = std::string{codespace}};
}

command_result_t engine::execute_payload(const command_t& command,
                                         const timestamp_milliseconds_t now) {
  auto caller = vestlock::access::make_account_id(command.signer);
  return std::visit(
      overloaded{
          [&](const initiate_lock_t& payload) {
            return timelock_.initiate_lock(caller, payload.asset,
                                           payload.amount, now);
          },
          [&](const release_t& payload) {
            return timelock_.release(caller, payload.asset, now);
          },
          [&](const sweep_native_t&) {
            return timelock_.sweep_native(caller);
          },
          [&](const transfer_control_t& payload) {
            return guard_.transfer_control(caller, payload.new_controller);
          },
          [&](const renounce_control_t&) {
            return guard_.renounce_control(caller);
          }},
      command.payload);
}

uint64_t engine::last_nonce(const signer_id_t& signer) const {
  return storage_.get<uint64_t>(encoder_, key::make_nonce_key(signer))
      .value_or(0);
}

hash32_t engine::compute_state_root() const {
  auto hasher = vestlock::blake3::hasher{};
  hasher.update(bytes_view_t{chain_id_.data(), chain_id_.size()});
  for (const auto prefix : {key::kLockKeyPrefix, key::kControllerKey}) {
    for (const auto& [row_key, row_value] :
         storage_.list_by_prefix(make_bytes_view(prefix))) {
      hasher.update(make_bytes_view(row_key));
      hasher.update(make_bytes_view(row_value));
    }
  }
  return hasher.finalize();
}

void engine::commit() {
  committed_.sequence += 1;
  committed_.state_root = compute_state_root();
  storage_.save_committed_state(committed_);
  spdlog::debug("Committed sequence {} state root {}", committed_.sequence,
                to_hex(committed_.state_root));
}

}  // namespace vestlock::execution
