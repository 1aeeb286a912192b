#include <vestlock/ledger/adapter.hpp>

#include <spdlog/spdlog.h>

namespace vestlock::ledger {

namespace {

transfer_outcome log_outcome(const std::string_view call,
                             const ledger_response& response) {
  auto outcome = classify(response);
  if (!succeeded(outcome)) {
    spdlog::warn("Ledger {} not confirmed: {}", call, to_string(outcome));
  }
  return outcome;
}

}  // namespace

transfer_outcome classify(const ledger_response& response) {
  if (response.reverted) {
    return transfer_outcome::reverted;
  }
  if (!response.returned.has_value()) {
    return transfer_outcome::no_return_value;
  }
  return response.returned.value() ? transfer_outcome::confirmed
                                   : transfer_outcome::rejected;
}

std::string_view to_string(const transfer_outcome outcome) {
  switch (outcome) {
    case transfer_outcome::confirmed:
      return "confirmed";
    case transfer_outcome::rejected:
      return "rejected";
    case transfer_outcome::reverted:
      return "reverted";
    case transfer_outcome::no_return_value:
      return "no_return_value";
  }
  return "unknown";
}

transfer_outcome adapter::pull(const vestlock::schema::asset_id_t& asset,
                               const vestlock::schema::account_id_t& from,
                               const vestlock::schema::account_id_t& to,
                               const vestlock::schema::amount_t& amount) {
  return log_outcome("pull", transfer_from(asset, from, to, amount));
}

transfer_outcome adapter::push(const vestlock::schema::asset_id_t& asset,
                               const vestlock::schema::account_id_t& to,
                               const vestlock::schema::amount_t& amount) {
  return log_outcome("push", transfer(asset, to, amount));
}

transfer_outcome adapter::push_native(
    const vestlock::schema::account_id_t& to,
    const vestlock::schema::amount_t& amount) {
  return log_outcome("native push", send_native(to, amount));
}

}  // namespace vestlock::ledger
