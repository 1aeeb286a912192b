#pragma once
#include <vestlock/schema/primitives.hpp>

// Schema type: initiate lock.
// Pull `amount` of `asset` from the controller into the vault and start a
// lock cycle for that asset.
namespace vestlock::schema {

template <uint16_t Version>
struct initiate_lock;

template <>
struct initiate_lock<1> final {
  uint16_t version{1};
  asset_id_t asset{};
  amount_t amount{};
};

using initiate_lock_t = initiate_lock<1>;

}  // namespace vestlock::schema
