#include <quorum/crypto/openssl_types.hpp>
#include <quorum/crypto/signing_key.hpp>
#include <quorum/crypto/verify.hpp>

#include <openssl/core_names.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace quorum::crypto {

namespace {

using namespace quorum::crypto::detail;

constexpr auto kMaxGenerateAttempts = 16;

evp_pkey_ptr make_keypair(
    const quorum::schema::secp256k1_private_key_t& private_key,
    const quorum::schema::secp256k1_public_key_t& public_key) {
  auto empty = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto scalar = bignum_ptr{
      BN_bin2bn(private_key.data(), private_key.size(), nullptr), BN_free};
  auto builder = ossl_param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!scalar || !builder) {
    return empty;
  }
  if (OSSL_PARAM_BLD_push_utf8_string(
          builder.get(), OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1", 0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             scalar.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key.data(),
                                       public_key.size()) != 1) {
    return empty;
  }
  auto params =
      ossl_param_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return empty;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return empty;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

}  // namespace

signing_key::signing_key(
    const quorum::schema::secp256k1_private_key_t& private_key,
    const quorum::schema::secp256k1_public_key_t& public_key)
    : private_key_{private_key},
      public_key_{public_key},
      address_{address_of(public_key)} {}

std::optional<signing_key> signing_key::generate() {
  for (auto attempt = 0; attempt < kMaxGenerateAttempts; ++attempt) {
    auto candidate = quorum::schema::secp256k1_private_key_t{};
    if (RAND_bytes(candidate.data(), static_cast<int>(candidate.size())) != 1) {
      spdlog::error("RAND_bytes failed while generating a signing key");
      return std::nullopt;
    }
    auto key = from_private_key(candidate);
    if (key) {
      return key;
    }
  }
  return std::nullopt;
}

std::optional<signing_key> signing_key::from_private_key(
    const quorum::schema::secp256k1_private_key_t& private_key) {
  auto public_key = derive_public_key(private_key);
  if (!public_key) {
    return std::nullopt;
  }
  return signing_key{private_key, *public_key};
}

const quorum::schema::secp256k1_private_key_t& signing_key::private_key()
    const {
  return private_key_;
}

const quorum::schema::secp256k1_public_key_t& signing_key::public_key() const {
  return public_key_;
}

const quorum::schema::address_t& signing_key::address() const {
  return address_;
}

std::optional<quorum::schema::secp256k1_signature_t> signing_key::sign(
    const quorum::schema::hash32_t& digest) const {
  const auto* group = detail::secp256k1_group();
  if (group == nullptr) {
    return std::nullopt;
  }
  auto pkey = make_keypair(private_key_, public_key_);
  if (!pkey) {
    return std::nullopt;
  }

  // No message digest is configured, the 32 bytes are signed as the digest.
  auto ctx =
      evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr),
                       EVP_PKEY_CTX_free};
  auto der_size = size_t{};
  if (!ctx || EVP_PKEY_sign_init(ctx.get()) != 1 ||
      EVP_PKEY_sign(ctx.get(), nullptr, &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_PKEY_sign(ctx.get(), der.data(), &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const unsigned char*>(der.data());
  auto ecdsa_sig =
      ecdsa_sig_ptr{d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
                    ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return std::nullopt;
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(ecdsa_sig.get(), &r, &s);

  // Normalize to low-s so a signature has one encoding.
  const auto* order = EC_GROUP_get0_order(group);
  auto half_order = bignum_ptr{BN_dup(order), BN_free};
  auto normalized_s = bignum_ptr{BN_dup(s), BN_free};
  if (!half_order || !normalized_s ||
      BN_rshift1(half_order.get(), half_order.get()) != 1) {
    return std::nullopt;
  }
  if (BN_cmp(normalized_s.get(), half_order.get()) > 0 &&
      BN_sub(normalized_s.get(), order, normalized_s.get()) != 1) {
    return std::nullopt;
  }

  auto signature = quorum::schema::secp256k1_signature_t{};
  if (BN_bn2binpad(r, signature.data(), 32) != 32 ||
      BN_bn2binpad(normalized_s.get(), signature.data() + 32, 32) != 32) {
    return std::nullopt;
  }

  for (auto recovery_id = uint8_t{0}; recovery_id < 2; ++recovery_id) {
    signature[64] = recovery_id;
    auto recovered = recover_public_key(digest, signature);
    if (recovered && *recovered == public_key_) {
      return signature;
    }
  }
  spdlog::warn("no recovery id reproduces the signing public key");
  return std::nullopt;
}

}  // namespace quorum::crypto
