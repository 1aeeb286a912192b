#include <vestlock/schema/enum_string.hpp>
#include <vestlock/schema/lock_error_code.hpp>

namespace vestlock::schema {

namespace {

constexpr auto kLockErrorNames = enum_names_t<lock_error_code, 19>{{
    {"ok", lock_error_code::ok},
    {"invalid_command", lock_error_code::invalid_command},
    {"unsupported_version", lock_error_code::unsupported_version},
    {"invalid_chain_id", lock_error_code::invalid_chain_id},
    {"invalid_nonce", lock_error_code::invalid_nonce},
    {"invalid_signature_type", lock_error_code::invalid_signature_type},
    {"signature_verification_failed",
     lock_error_code::signature_verification_failed},
    {"not_authorized", lock_error_code::not_authorized},
    {"invalid_asset", lock_error_code::invalid_asset},
    {"zero_amount", lock_error_code::zero_amount},
    {"already_locked", lock_error_code::already_locked},
    {"not_vested", lock_error_code::not_vested},
    {"still_locked", lock_error_code::still_locked},
    {"nothing_to_release", lock_error_code::nothing_to_release},
    {"transfer_pull_failed", lock_error_code::transfer_pull_failed},
    {"transfer_push_failed", lock_error_code::transfer_push_failed},
    {"invalid_controller", lock_error_code::invalid_controller},
    {"controller_already_set", lock_error_code::controller_already_set},
    {"invalid_timestamp", lock_error_code::invalid_timestamp},
}};

}  // namespace

std::string_view to_string(const lock_error_code code) {
  return vestlock::schema::to_string(code, kLockErrorNames)
      .value_or(std::string_view{"unknown"});
}

}  // namespace vestlock::schema
