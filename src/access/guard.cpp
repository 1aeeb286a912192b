#include <spdlog/spdlog.h>
#include <vestlock/access/guard.hpp>
#include <vestlock/schema/key/engine_keys.hpp>

#include <string>
#include <utility>

using namespace vestlock::schema;

namespace vestlock::access {

namespace {

constexpr auto kCodespace = "vestlock.access";

command_result_t reject(const lock_error_code code, std::string log) {
  spdlog::warn("Access operation rejected: {} ({})", log, to_string(code));
  return command_result_t{.code = static_cast<uint32_t>(code),
                          .log = std::move(log),
                          .codespace = kCodespace};
}

}  // namespace

guard::guard(
    vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag>&
        storage)
    : storage_{storage} {}

bool guard::authorize(const account_id_t& caller) const {
  auto current = controller();
  return current.has_value() && current.value() == caller;
}

std::optional<account_id_t> guard::controller() const {
  return load().value_or(std::nullopt);
}

bool guard::renounced() const {
  auto stored = load();
  return stored.has_value() && !stored->has_value();
}

command_result_t guard::bootstrap(const account_id_t& controller) {
  if (load().has_value()) {
    return reject(lock_error_code::controller_already_set,
                  "controller was already assigned");
  }
  if (is_zero(controller)) {
    return reject(lock_error_code::invalid_controller,
                  "controller must not be the null id");
  }
  store(controller);
  spdlog::info("Controller bootstrapped to {}", to_hex(controller));
  return command_result_t{
      .codespace = kCodespace,
      .events = {make_controller_transferred_event(make_zero_hash(),
                                                   controller)}};
}

command_result_t guard::transfer_control(const account_id_t& caller,
                                         const account_id_t& new_controller) {
  if (!authorize(caller)) {
    return reject(lock_error_code::not_authorized,
                  "caller is not the controller");
  }
  if (is_zero(new_controller)) {
    return reject(lock_error_code::invalid_controller,
                  "new controller must not be the null id");
  }
  store(new_controller);
  spdlog::info("Control transferred from {} to {}", to_hex(caller),
               to_hex(new_controller));
  return command_result_t{
      .codespace = kCodespace,
      .events = {make_controller_transferred_event(caller, new_controller)}};
}

command_result_t guard::renounce_control(const account_id_t& caller) {
  if (!authorize(caller)) {
    return reject(lock_error_code::not_authorized,
                  "caller is not the controller");
  }
  store(std::nullopt);
  spdlog::warn("Control renounced by {}; vault is now permanently ownerless",
               to_hex(caller));
  return command_result_t{
      .codespace = kCodespace,
      .events = {make_controller_transferred_event(caller, make_zero_hash())}};
}

std::optional<std::optional<account_id_t>> guard::load() const {
  auto key = make_bytes(key::kControllerKey);
  return storage_.get<std::optional<account_id_t>>(encoder_, key);
}

void guard::store(const std::optional<account_id_t>& controller) {
  auto key = make_bytes(key::kControllerKey);
  storage_.put(encoder_, key, controller);
}

}  // namespace vestlock::access
