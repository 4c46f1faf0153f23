#include <keyward/common/critical.hpp>
#include <keyward/crypto/signing_key.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>

#include <algorithm>
#include <cstring>
#include <utility>
#include <vector>

namespace keyward::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

}  // namespace

signing_key::signing_key(evp_pkey_ptr key) : key_{std::move(key)} {}

std::shared_ptr<const signing_key> signing_key::generate() {
  auto key = evp_pkey_ptr{EVP_EC_gen("secp256k1"), EVP_PKEY_free};
  if (!key) {
    keyward::common::critical("failed to generate secp256k1 session key");
  }
  return std::make_shared<const signing_key>(std::move(key));
}

compressed_public_key_t signing_key::public_key() const {
  auto encoded = std::array<uint8_t, 65>{};
  auto encoded_size = size_t{};
  if (EVP_PKEY_get_octet_string_param(key_.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                      encoded.data(), encoded.size(),
                                      &encoded_size) != 1) {
    keyward::common::critical("failed to read session public key");
  }

  auto out = compressed_public_key_t{};
  if (encoded_size == out.size()) {
    std::copy_n(encoded.data(), out.size(), out.data());
    return out;
  }
  if (encoded_size != encoded.size() || encoded[0] != 0x04) {
    keyward::common::critical("unexpected session public key encoding");
  }
  // 0x04 || x || y  ->  (0x02 | parity(y)) || x
  out[0] = static_cast<uint8_t>(0x02u | (encoded[64] & 0x01u));
  std::copy_n(encoded.data() + 1, 32, out.data() + 1);
  return out;
}

compact_signature_t signing_key::sign(
    const keyward::schema::bytes_view_t& message) const {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                                 key_.get()) != 1) {
    keyward::common::critical("failed to initialise session key signer");
  }

  auto der_size = size_t{};
  if (EVP_DigestSign(ctx.get(), nullptr, &der_size, message.data(),
                     message.size()) != 1) {
    keyward::common::critical("failed to size session key signature");
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_DigestSign(ctx.get(), der.data(), &der_size, message.data(),
                     message.size()) != 1) {
    keyward::common::critical("failed to sign with session key");
  }

  const auto* der_ptr = der.data();
  auto parsed = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!parsed) {
    keyward::common::critical("failed to parse session key signature");
  }

  auto out = compact_signature_t{};
  if (BN_bn2binpad(ECDSA_SIG_get0_r(parsed.get()), out.data(), 32) != 32 ||
      BN_bn2binpad(ECDSA_SIG_get0_s(parsed.get()), out.data() + 32, 32) != 32) {
    keyward::common::critical("failed to encode compact signature");
  }
  return out;
}

}  // namespace keyward::crypto
