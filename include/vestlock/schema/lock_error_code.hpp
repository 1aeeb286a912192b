#pragma once

#include <cstdint>
#include <string_view>

namespace vestlock::schema {

// 1..9 envelope validation, 10 and up vault operations.
enum class lock_error_code : uint32_t {
  ok = 0,
  invalid_command = 1,
  unsupported_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  not_authorized = 10,
  invalid_asset = 11,
  zero_amount = 12,
  already_locked = 13,
  not_vested = 14,
  still_locked = 15,
  nothing_to_release = 16,
  transfer_pull_failed = 17,
  transfer_push_failed = 18,
  invalid_controller = 19,
  controller_already_set = 20,
  invalid_timestamp = 21,
};

std::string_view to_string(lock_error_code code);

}  // namespace vestlock::schema
