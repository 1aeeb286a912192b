#pragma once
#include <vestlock/schema/primitives.hpp>

// Schema type: lock record.
// Persisted maturity of one asset. Presence of the record means an active
// lock; `locked_at` and `last_amount` describe the initiating call and are
// informational only.
namespace vestlock::schema {

template <uint16_t Version>
struct lock_record;

template <>
struct lock_record<1> final {
  uint16_t version{1};
  asset_id_t asset{};
  timestamp_milliseconds_t maturity{};
  timestamp_milliseconds_t locked_at{};
  amount_t last_amount{};
};

using lock_record_t = lock_record<1>;

}  // namespace vestlock::schema
