#include <vestlock/blake3/hash.hpp>

namespace vestlock::blake3 {

vestlock::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

vestlock::schema::hash32_t hash(const vestlock::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const vestlock::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

vestlock::schema::hash32_t hasher::finalize() const {
  // blake3_hasher_finalize leaves the state untouched, so finalize is const.
  auto output = vestlock::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

}  // namespace vestlock::blake3
