#pragma once
#include <vestlock/schema/primitives.hpp>

// Schema type: transfer control.
// Hand the controller role to another identity.
namespace vestlock::schema {

template <uint16_t Version>
struct transfer_control;

template <>
struct transfer_control<1> final {
  uint16_t version{1};
  account_id_t new_controller{};
};

using transfer_control_t = transfer_control<1>;

}  // namespace vestlock::schema
