#pragma once
#include <cstdint>

// Schema type: sweep native.
// Send any native currency held by the vault to the controller.
namespace vestlock::schema {

template <uint16_t Version>
struct sweep_native;

template <>
struct sweep_native<1> final {
  uint16_t version{1};
};

using sweep_native_t = sweep_native<1>;

}  // namespace vestlock::schema
