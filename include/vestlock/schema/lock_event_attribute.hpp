#pragma once

#include <cstdint>
#include <string>

// Schema type: lock event attribute.
// Key/value pair attached to a lock event; `index` marks attributes external
// indexers should key on.
namespace vestlock::schema {

template <uint16_t Version>
struct lock_event_attribute;

template <>
struct lock_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using lock_event_attribute_t = lock_event_attribute<1>;

}  // namespace vestlock::schema
