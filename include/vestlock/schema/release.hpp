#pragma once
#include <vestlock/schema/primitives.hpp>

// Schema type: release.
// Send the whole vault balance of a matured asset to the controller.
namespace vestlock::schema {

template <uint16_t Version>
struct release;

template <>
struct release<1> final {
  uint16_t version{1};
  asset_id_t asset{};
};

using release_t = release<1>;

}  // namespace vestlock::schema
