#pragma once

#include <vestlock/schema/primitives.hpp>
#include <functional>

namespace vestlock::execution {

using signature_verifier_t =
    std::function<bool(const vestlock::schema::bytes_view_t& message,
                       const vestlock::schema::signer_id_t& signer,
                       const vestlock::schema::signature_t& signature)>;

}  // namespace vestlock::execution
