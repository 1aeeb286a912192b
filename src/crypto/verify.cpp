#include <vestlock/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace vestlock::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

evp_pkey_ptr load_ed25519_key(const vestlock::schema::ed25519_signer_id& id) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                  id.public_key.data(), id.public_key.size()),
      EVP_PKEY_free};
}

evp_pkey_ptr load_secp256k1_key(
    const vestlock::schema::secp256k1_signer_id& id) {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params = std::array{
      OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group_name,
                                       0),
      OSSL_PARAM_construct_octet_string(
          OSSL_PKEY_PARAM_PUB_KEY,
          const_cast<unsigned char*>(id.public_key.data()),
          id.public_key.size()),
      OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

// The recovery byte is 0..3 or legacy 27+; anything else is malformed.
bool is_recovery_byte(const uint8_t value) {
  return value <= 3 || value >= 27;
}

// Strip the recovery byte and re-encode r||s as a DER ECDSA signature.
std::optional<std::vector<uint8_t>> secp256k1_der(
    const vestlock::schema::secp256k1_signature_t& signature) {
  const auto* compact = static_cast<const uint8_t*>(nullptr);
  if (is_recovery_byte(signature[0])) {
    compact = signature.data() + 1;
  } else if (is_recovery_byte(signature[64])) {
    compact = signature.data();
  } else {
    return std::nullopt;
  }

  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(compact, 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact + 32, 32, nullptr), BN_free};
  if (!ecdsa_sig || !r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // ECDSA_SIG owns r and s from here on.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr) != der_len) {
    return std::nullopt;
  }
  return der;
}

bool digest_verify(EVP_PKEY* key,
                   const EVP_MD* digest,
                   const std::span<const uint8_t>& signature,
                   const vestlock::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, key) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return available_now;
}

bool verify_signature(const vestlock::schema::bytes_view_t& message,
                      const vestlock::schema::signer_id_t& signer,
                      const vestlock::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const vestlock::schema::ed25519_signer_id& id) {
            const auto* sig =
                std::get_if<vestlock::schema::ed25519_signature_t>(&signature);
            if (sig == nullptr) {
              return false;
            }
            auto key = load_ed25519_key(id);
            return key != nullptr &&
                   digest_verify(key.get(), nullptr, *sig, message);
          },
          [&](const vestlock::schema::secp256k1_signer_id& id) {
            const auto* sig =
                std::get_if<vestlock::schema::secp256k1_signature_t>(
                    &signature);
            if (sig == nullptr) {
              return false;
            }
            auto der = secp256k1_der(*sig);
            auto key = load_secp256k1_key(id);
            if (!der || !key) {
              spdlog::debug("Malformed secp256k1 key or signature");
              return false;
            }
            return digest_verify(key.get(), EVP_sha256(), *der, message);
          },
          [](const vestlock::schema::named_signer_t&) { return false; }},
      signer);
}

}  // namespace vestlock::crypto
