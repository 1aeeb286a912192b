#include <vestlock/schema/key/builder.hpp>
#include <algorithm>
#include <iterator>
#include <ranges>

using namespace vestlock::schema::key;
using namespace vestlock::schema;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const hash32_t& hash) {
  return write(std::span<const uint8_t>{hash.data(), hash.size()});
}

builder& builder::write(const signer_id_t& signer_id) {
  std::visit(overloaded{[this](const ed25519_signer_id& arg) {
                          this->write(uint8_t{0});
                          this->write(std::span<const uint8_t>(
                              arg.public_key.data(), arg.public_key.size()));
                        },
                        [this](const secp256k1_signer_id& arg) {
                          this->write(uint8_t{1});
                          this->write(std::span<const uint8_t>(
                              arg.public_key.data(), arg.public_key.size()));
                        },
                        [this](const named_signer_t& arg) {
                          this->write(uint8_t{2});
                          this->write(arg);
                        }},
             signer_id);
  return *this;
}
