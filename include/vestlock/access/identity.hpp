#pragma once

#include <vestlock/schema/primitives.hpp>
#include <optional>
#include <string_view>

namespace vestlock::access {

vestlock::schema::account_id_t make_account_id(
    const vestlock::schema::signer_id_t& signer);

std::optional<vestlock::schema::signer_id_t> try_make_signer_id(
    std::string_view kind,
    std::string_view hex);

}  // namespace vestlock::access
