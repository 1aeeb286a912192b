#include <spdlog/spdlog.h>
#include <vestlock/common/critical.hpp>
#include <vestlock/schema/key/engine_keys.hpp>
#include <vestlock/vault/lock_registry.hpp>

using namespace vestlock::schema;

namespace vestlock::vault {

lock_registry::lock_registry(
    vestlock::storage::storage<vestlock::storage::rocksdb_storage_tag>&
        storage)
    : storage_{storage} {}

std::optional<timestamp_milliseconds_t> lock_registry::get(
    const asset_id_t& asset) const {
  auto record = find(asset);
  if (!record.has_value()) {
    return std::nullopt;
  }
  return record->maturity;
}

std::optional<lock_record_t> lock_registry::find(
    const asset_id_t& asset) const {
  auto key = key::make_lock_key(asset);
  return storage_.get<lock_record_t>(encoder_, key);
}

lock_error_code lock_registry::set(const lock_record_t& record,
                                   const timestamp_milliseconds_t now) {
  auto existing = get(record.asset);
  if (existing.has_value() && existing.value() > now) {
    return lock_error_code::already_locked;
  }
  put(record);
  return lock_error_code::ok;
}

void lock_registry::put(const lock_record_t& record) {
  auto key = key::make_lock_key(record.asset);
  storage_.put(encoder_, key, record);
  spdlog::debug("Lock registry set asset {} maturity {}",
                to_hex(record.asset), record.maturity);
}

void lock_registry::clear(const asset_id_t& asset) {
  auto key = key::make_lock_key(asset);
  storage_.erase(key);
  spdlog::debug("Lock registry cleared asset {}", to_hex(asset));
}

std::vector<lock_record_t> lock_registry::list() const {
  auto prefix = make_bytes(key::kLockKeyPrefix);
  auto rows = storage_.list_by_prefix(prefix);

  auto records = std::vector<lock_record_t>{};
  records.reserve(rows.size());
  for (const auto& [row_key, row_value] : rows) {
    auto record = encoder_.try_decode<lock_record_t>(
        bytes_view_t{row_value.data(), row_value.size()});
    if (!record.has_value()) {
      vestlock::common::critical("undecodable lock record in registry");
    }
    records.push_back(std::move(record.value()));
  }
  return records;
}

}  // namespace vestlock::vault
