#pragma once

#include <vestlock/schema/primitives.hpp>

namespace vestlock::crypto {

bool available();

bool verify_signature(const vestlock::schema::bytes_view_t& message,
                      const vestlock::schema::signer_id_t& signer,
                      const vestlock::schema::signature_t& signature);

}  // namespace vestlock::crypto
