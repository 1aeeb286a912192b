#pragma once
#include <vestlock/schema/initiate_lock.hpp>
#include <vestlock/schema/primitives.hpp>
#include <vestlock/schema/release.hpp>
#include <vestlock/schema/renounce_control.hpp>
#include <vestlock/schema/sweep_native.hpp>
#include <vestlock/schema/transfer_control.hpp>
#include <variant>

namespace vestlock::schema {

using command_payload_t = std::variant<initiate_lock_t,
                                       release_t,
                                       sweep_native_t,
                                       transfer_control_t,
                                       renounce_control_t>;

template <uint16_t Version>
struct command;

template <>
struct command<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  command_payload_t payload{};
  signature_t signature;
};

using command_t = command<1>;

}  // namespace vestlock::schema
