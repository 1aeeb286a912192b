#pragma once
#include <cstdint>

// Schema type: renounce control.
// Drop the controller role permanently; no identity is authorized afterwards.
namespace vestlock::schema {

template <uint16_t Version>
struct renounce_control;

template <>
struct renounce_control<1> final {
  uint16_t version{1};
};

using renounce_control_t = renounce_control<1>;

}  // namespace vestlock::schema
