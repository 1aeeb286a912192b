#pragma once

#include <vestlock/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace vestlock::ledger {

/// What a fungible ledger answered to a transfer call, before any
/// interpretation. `returned` is empty when the call produced no return value.
struct ledger_response final {
  bool reverted{};
  std::optional<bool> returned;
};

enum class transfer_outcome : uint8_t {
  confirmed = 0,
  rejected = 1,
  reverted = 2,
  no_return_value = 3,
};

/// Only an explicit `true` from a call that did not revert is `confirmed`.
transfer_outcome classify(const ledger_response& response);

inline bool succeeded(const transfer_outcome outcome) {
  return outcome == transfer_outcome::confirmed;
}

std::string_view to_string(transfer_outcome outcome);

/// Moves units of fungible assets between the controller and the vault.
///
/// Implementations answer the raw ledger calls; the public entry points
/// classify every response so callers only ever see a `transfer_outcome`.
/// A transfer implementation may call back into the vault before it returns.
class adapter {
 public:
  virtual ~adapter() = default;

  transfer_outcome pull(const vestlock::schema::asset_id_t& asset,
                        const vestlock::schema::account_id_t& from,
                        const vestlock::schema::account_id_t& to,
                        const vestlock::schema::amount_t& amount);

  transfer_outcome push(const vestlock::schema::asset_id_t& asset,
                        const vestlock::schema::account_id_t& to,
                        const vestlock::schema::amount_t& amount);

  transfer_outcome push_native(const vestlock::schema::account_id_t& to,
                               const vestlock::schema::amount_t& amount);

  virtual vestlock::schema::amount_t balance_of(
      const vestlock::schema::asset_id_t& asset,
      const vestlock::schema::account_id_t& holder) const = 0;

  virtual vestlock::schema::amount_t native_balance_of(
      const vestlock::schema::account_id_t& holder) const = 0;

  virtual const vestlock::schema::account_id_t& vault() const = 0;

 protected:
  virtual ledger_response transfer_from(
      const vestlock::schema::asset_id_t& asset,
      const vestlock::schema::account_id_t& from,
      const vestlock::schema::account_id_t& to,
      const vestlock::schema::amount_t& amount) = 0;

  virtual ledger_response transfer(
      const vestlock::schema::asset_id_t& asset,
      const vestlock::schema::account_id_t& to,
      const vestlock::schema::amount_t& amount) = 0;

  virtual ledger_response send_native(
      const vestlock::schema::account_id_t& to,
      const vestlock::schema::amount_t& amount) = 0;
};

}  // namespace vestlock::ledger
