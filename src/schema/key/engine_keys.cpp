#include <vestlock/schema/key/builder.hpp>
#include <vestlock/schema/key/engine_keys.hpp>

using namespace vestlock::schema;

namespace vestlock::schema::key {

bytes_t make_lock_key(const asset_id_t& asset) {
  auto b = builder{};
  b.write(kLockKeyPrefix);
  b.write(asset);
  return b.data;
}

bytes_t make_nonce_key(const signer_id_t& signer) {
  auto b = builder{};
  b.write(kNonceKeyPrefix);
  b.write(signer);
  return b.data;
}

bytes_t make_balance_key(const asset_id_t& asset, const account_id_t& holder) {
  auto b = builder{};
  b.write(kLedgerBalancePrefix);
  b.write(asset);
  b.write("|");
  b.write(holder);
  return b.data;
}

bytes_t make_native_balance_key(const account_id_t& holder) {
  auto b = builder{};
  b.write(kLedgerNativePrefix);
  b.write(holder);
  return b.data;
}

}  // namespace vestlock::schema::key
