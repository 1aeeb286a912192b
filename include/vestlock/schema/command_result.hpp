#pragma once

#include <vestlock/schema/lock_error_code.hpp>
#include <vestlock/schema/lock_event.hpp>
#include <vestlock/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace vestlock::schema {

template <uint16_t Version>
struct command_result;

template <>
struct command_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<lock_event_t> events;

  bool ok() const { return code == 0; }
  lock_error_code error() const { return static_cast<lock_error_code>(code); }
};

using command_result_t = command_result<1>;

}  // namespace vestlock::schema
