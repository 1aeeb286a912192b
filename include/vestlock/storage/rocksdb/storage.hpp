#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <vestlock/common/critical.hpp>
#include <vestlock/schema/encoding/scale/encoder.hpp>
#include <vestlock/schema/key/engine_keys.hpp>
#include <vestlock/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace vestlock::storage {

namespace detail {

using encoder_t = vestlock::schema::encoding::encoder<
    vestlock::schema::encoding::scale_encoder_tag>;

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const vestlock::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline vestlock::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const vestlock::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const vestlock::schema::bytes_view_t& key,
           const T& value) const;

  void erase(const vestlock::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const vestlock::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const vestlock::schema::bytes_view_t& key) const {
  if (!database) {
    vestlock::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    vestlock::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(vestlock::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const vestlock::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    vestlock::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(vestlock::schema::bytes_view_t{encoded_value.data(),
                                                      encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    vestlock::common::critical("Failed to put value into RocksDB");
  }
}

inline void storage<rocksdb_storage_tag>::erase(
    const vestlock::schema::bytes_view_t& key) const {
  if (!database) {
    vestlock::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete key from RocksDB: {}", status.ToString());
    vestlock::common::critical("Failed to delete key from RocksDB");
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto encoder = detail::encoder_t{};
  auto key = vestlock::schema::make_bytes(
      vestlock::schema::key::kEngineStateKey);
  auto decoded =
      get<std::tuple<uint64_t, vestlock::schema::hash32_t>>(encoder, key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  return committed_state{.sequence = std::get<0>(*decoded),
                         .state_root = std::get<1>(*decoded)};
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  auto encoder = detail::encoder_t{};
  auto key = vestlock::schema::make_bytes(
      vestlock::schema::key::kEngineStateKey);
  put(encoder, key, std::tuple{state.sequence, state.state_root});
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const vestlock::schema::bytes_view_t& prefix) const {
  if (!database) {
    vestlock::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    vestlock::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace vestlock::storage
