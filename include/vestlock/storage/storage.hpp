#pragma once
#include <vestlock/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace vestlock::storage {

using key_value_entry_t =
    std::pair<vestlock::schema::bytes_t, vestlock::schema::bytes_t>;

/// Engine checkpoint persisted after every executed command.
struct committed_state final {
  uint64_t sequence{};
  vestlock::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const vestlock::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const vestlock::schema::bytes_view_t& key,
           const T& value) const;

  /// Remove key. Removing a missing key is not an error.
  void erase(const vestlock::schema::bytes_view_t& key) const;

  /// Load the most recent engine checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent engine checkpoint.
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const vestlock::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace vestlock::storage
