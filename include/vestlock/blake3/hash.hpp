#pragma once
#include <blake3.h>
#include <vestlock/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace vestlock::blake3 {

vestlock::schema::hash32_t hash(const std::string_view& str);
vestlock::schema::hash32_t hash(const vestlock::schema::bytes_view_t& bytes);

class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const vestlock::schema::bytes_view_t& bytes);

  vestlock::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

}  // namespace vestlock::blake3
