#include <vestlock/schema/lock_event.hpp>

#include <utility>

namespace vestlock::schema {

namespace {

lock_event_attribute_t attribute(std::string key,
                                 std::string value,
                                 const bool index = false) {
  return lock_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

}  // namespace

lock_event_t make_vesting_initiated_event(
    const asset_id_t& asset,
    const amount_t& amount,
    const timestamp_milliseconds_t maturity) {
  return lock_event_t{
      .type = std::string{kVestingInitiatedEvent},
      .attributes = {attribute("asset", to_hex(asset), true),
                     attribute("amount", to_string(amount)),
                     attribute("maturity", std::to_string(maturity))}};
}

lock_event_t make_released_event(const asset_id_t& asset,
                                 const amount_t& amount) {
  return lock_event_t{.type = std::string{kReleasedEvent},
                      .attributes = {attribute("asset", to_hex(asset), true),
                                     attribute("amount", to_string(amount))}};
}

lock_event_t make_native_withdrawn_event(const account_id_t& recipient,
                                         const amount_t& amount) {
  return lock_event_t{
      .type = std::string{kNativeWithdrawnEvent},
      .attributes = {attribute("recipient", to_hex(recipient), true),
                     attribute("amount", to_string(amount))}};
}

lock_event_t make_controller_transferred_event(const account_id_t& previous,
                                               const account_id_t& next) {
  return lock_event_t{
      .type = std::string{kControllerTransferredEvent},
      .attributes = {attribute("previous", to_hex(previous), true),
                     attribute("next", to_hex(next), true)}};
}

std::optional<std::string> find_attribute(const lock_event_t& event,
                                          const std::string_view key) {
  for (const auto& entry : event.attributes) {
    if (entry.key == key) {
      return entry.value;
    }
  }
  return std::nullopt;
}

}  // namespace vestlock::schema
