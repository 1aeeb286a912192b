#include <vestlock/access/identity.hpp>
#include <vestlock/blake3/hash.hpp>

#include <algorithm>

namespace vestlock::access {

vestlock::schema::account_id_t make_account_id(
    const vestlock::schema::signer_id_t& signer) {
  return std::visit(
      overloaded{[](const vestlock::schema::ed25519_signer_id& value) {
                   return vestlock::schema::account_id_t{value.public_key};
                 },
                 [](const vestlock::schema::secp256k1_signer_id& value) {
                   return vestlock::blake3::hash(vestlock::schema::bytes_view_t{
                       value.public_key.data(), value.public_key.size()});
                 },
                 [](const vestlock::schema::named_signer_t& value) {
                   return value;
                 }},
      signer);
}

std::optional<vestlock::schema::signer_id_t> try_make_signer_id(
    const std::string_view kind,
    const std::string_view hex) {
  auto bytes = vestlock::schema::try_from_hex(hex);
  if (!bytes.has_value()) {
    return std::nullopt;
  }
  if (kind == "named" || kind == "ed25519") {
    if (bytes->size() != 32) {
      return std::nullopt;
    }
    auto key = vestlock::schema::make_hash32(*bytes);
    if (kind == "named") {
      return vestlock::schema::signer_id_t{key};
    }
    return vestlock::schema::signer_id_t{
        vestlock::schema::ed25519_signer_id{.public_key = key}};
  }
  if (kind == "secp256k1") {
    auto signer = vestlock::schema::secp256k1_signer_id{};
    if (bytes->size() != signer.public_key.size()) {
      return std::nullopt;
    }
    std::copy(bytes->begin(), bytes->end(), signer.public_key.begin());
    return vestlock::schema::signer_id_t{signer};
  }
  return std::nullopt;
}

}  // namespace vestlock::access
