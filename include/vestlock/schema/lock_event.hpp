#pragma once

#include <vestlock/schema/lock_event_attribute.hpp>
#include <vestlock/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: lock event.
// Notification emitted for external observers on every successful state
// transition (vesting_initiated, released, native_withdrawn,
// controller_transferred).
namespace vestlock::schema {

template <uint16_t Version>
struct lock_event;

template <>
struct lock_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<lock_event_attribute_t> attributes;
};

using lock_event_t = lock_event<1>;

inline constexpr auto kVestingInitiatedEvent =
    std::string_view{"vesting_initiated"};
inline constexpr auto kReleasedEvent = std::string_view{"released"};
inline constexpr auto kNativeWithdrawnEvent =
    std::string_view{"native_withdrawn"};
inline constexpr auto kControllerTransferredEvent =
    std::string_view{"controller_transferred"};

lock_event_t make_vesting_initiated_event(const asset_id_t& asset,
                                          const amount_t& amount,
                                          timestamp_milliseconds_t maturity);
lock_event_t make_released_event(const asset_id_t& asset,
                                 const amount_t& amount);
lock_event_t make_native_withdrawn_event(const account_id_t& recipient,
                                         const amount_t& amount);
lock_event_t make_controller_transferred_event(const account_id_t& previous,
                                               const account_id_t& next);

std::optional<std::string> find_attribute(const lock_event_t& event,
                                          std::string_view key);

}  // namespace vestlock::schema
