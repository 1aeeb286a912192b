#pragma once
#include <vestlock/schema/primitives.hpp>
#include <optional>
#include <span>

namespace vestlock::schema::encoding {

// The wire and storage codec is chosen at build time through the tag type.
// Everything that persists or signs bytes goes through this facade so the
// codec library never leaks into the state machine.
template <typename Library>
struct encoder {
  template <typename T>
  vestlock::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, vestlock::schema::bytes_t& out);

  template <typename T>
  T decode(const vestlock::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const vestlock::schema::bytes_view_t& bytes);
};

}  // namespace vestlock::schema::encoding
