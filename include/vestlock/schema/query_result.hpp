#pragma once

#include <vestlock/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace vestlock::schema {

enum class query_error_code : uint32_t {
  ok = 0,
  unsupported_path = 1,
  invalid_key = 2,
};

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t key;
  bytes_t value;
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace vestlock::schema
