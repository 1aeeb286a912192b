#pragma once

#include <vestlock/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace vestlock::testing {

/// 2024-01-01T00:00:00Z.
inline constexpr vestlock::schema::timestamp_milliseconds_t kGenesisTime =
    1704067200000ULL;

inline vestlock::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = vestlock::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline vestlock::schema::named_signer_t make_named_signer_id(
    const uint8_t seed) {
  auto named = vestlock::schema::named_signer_t{};
  named[0] = seed;
  return named;
}

inline vestlock::schema::signer_id_t make_named_signer(const uint8_t seed) {
  return vestlock::schema::signer_id_t{make_named_signer_id(seed)};
}

inline vestlock::schema::amount_t make_amount(const uint64_t value) {
  return vestlock::schema::amount_t{value};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Temporary directory removed when the owner goes away. Declare it ahead of
/// the storage that lives in it.
class scoped_path final {
 public:
  explicit scoped_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}
  scoped_path(const scoped_path&) = delete;
  scoped_path& operator=(const scoped_path&) = delete;
  ~scoped_path() { remove_path(path_); }

  const std::string& string() const { return path_; }

 private:
  std::string path_;
};

}  // namespace vestlock::testing
