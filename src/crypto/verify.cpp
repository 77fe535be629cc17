#include <quorum/blake3/hash.hpp>
#include <quorum/crypto/openssl_types.hpp>
#include <quorum/crypto/verify.hpp>

#include <openssl/obj_mac.h>

#include <algorithm>
#include <iterator>

namespace quorum::crypto {

namespace detail {

const EC_GROUP* secp256k1_group() {
  static const auto group =
      std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>{
          EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free};
  return group.get();
}

}  // namespace detail

namespace {

using namespace quorum::crypto::detail;

std::optional<quorum::schema::secp256k1_public_key_t> serialize_point(
    const EC_GROUP* group,
    const EC_POINT* point,
    BN_CTX* ctx) {
  if (EC_POINT_is_at_infinity(group, point) == 1) {
    return std::nullopt;
  }
  auto out = quorum::schema::secp256k1_public_key_t{};
  auto written = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                                    out.data(), out.size(), ctx);
  if (written != out.size()) {
    return std::nullopt;
  }
  return out;
}

bool in_scalar_range(const BIGNUM* value, const BIGNUM* order) {
  return BN_is_zero(value) == 0 && BN_cmp(value, order) < 0;
}

}  // namespace

bool available() {
  return detail::secp256k1_group() != nullptr;
}

std::optional<quorum::schema::secp256k1_public_key_t> derive_public_key(
    const quorum::schema::secp256k1_private_key_t& private_key) {
  const auto* group = detail::secp256k1_group();
  if (group == nullptr) {
    return std::nullopt;
  }
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto scalar = bignum_ptr{
      BN_bin2bn(private_key.data(), private_key.size(), nullptr), BN_free};
  if (!ctx || !scalar ||
      !in_scalar_range(scalar.get(), EC_GROUP_get0_order(group))) {
    return std::nullopt;
  }
  auto point = ec_point_ptr{EC_POINT_new(group), EC_POINT_free};
  if (!point || EC_POINT_mul(group, point.get(), scalar.get(), nullptr,
                             nullptr, ctx.get()) != 1) {
    return std::nullopt;
  }
  return serialize_point(group, point.get(), ctx.get());
}

quorum::schema::address_t address_of(
    const quorum::schema::secp256k1_public_key_t& public_key) {
  auto digest = quorum::blake3::hash(
      quorum::schema::bytes_view_t{public_key.data() + 1, public_key.size() - 1});
  auto address = quorum::schema::address_t{};
  std::copy(std::end(digest) - address.size(), std::end(digest),
            std::begin(address));
  return address;
}

std::optional<quorum::schema::secp256k1_public_key_t> recover_public_key(
    const quorum::schema::hash32_t& digest,
    const quorum::schema::secp256k1_signature_t& signature) {
  const auto* group = detail::secp256k1_group();
  if (group == nullptr) {
    return std::nullopt;
  }

  auto recovery_id = signature[64];
  if (recovery_id >= 27) {
    recovery_id = static_cast<uint8_t>(recovery_id - 27);
  }
  if (recovery_id > 1) {
    return std::nullopt;
  }

  const auto* order = EC_GROUP_get0_order(group);
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto r = bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr), BN_free};
  auto e = bignum_ptr{BN_bin2bn(digest.data(), digest.size(), nullptr), BN_free};
  if (!ctx || !r || !s || !e) {
    return std::nullopt;
  }
  if (!in_scalar_range(r.get(), order) || !in_scalar_range(s.get(), order)) {
    return std::nullopt;
  }

  // R is the nonce point with x = r and the parity selected by the recovery id.
  auto nonce_point = ec_point_ptr{EC_POINT_new(group), EC_POINT_free};
  if (!nonce_point ||
      EC_POINT_set_compressed_coordinates(group, nonce_point.get(), r.get(),
                                          recovery_id, ctx.get()) != 1) {
    return std::nullopt;
  }

  // Q = (-e * r^-1) G + (s * r^-1) R
  auto r_inverse = bignum_ptr{BN_new(), BN_free};
  auto u1 = bignum_ptr{BN_new(), BN_free};
  auto u2 = bignum_ptr{BN_new(), BN_free};
  if (!r_inverse || !u1 || !u2 ||
      BN_mod_inverse(r_inverse.get(), r.get(), order, ctx.get()) == nullptr ||
      BN_nnmod(e.get(), e.get(), order, ctx.get()) != 1 ||
      BN_mod_sub(u1.get(), order, e.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u1.get(), u1.get(), r_inverse.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u2.get(), s.get(), r_inverse.get(), order, ctx.get()) != 1) {
    return std::nullopt;
  }

  auto public_point = ec_point_ptr{EC_POINT_new(group), EC_POINT_free};
  if (!public_point ||
      EC_POINT_mul(group, public_point.get(), u1.get(), nonce_point.get(),
                   u2.get(), ctx.get()) != 1) {
    return std::nullopt;
  }
  return serialize_point(group, public_point.get(), ctx.get());
}

std::optional<quorum::schema::address_t> recover_address(
    const quorum::schema::hash32_t& digest,
    const quorum::schema::secp256k1_signature_t& signature) {
  auto public_key = recover_public_key(digest, signature);
  if (!public_key) {
    return std::nullopt;
  }
  return address_of(*public_key);
}

bool verify_signature(const quorum::schema::hash32_t& digest,
                      const quorum::schema::address_t& signer,
                      const quorum::schema::secp256k1_signature_t& signature) {
  auto recovered = recover_address(digest, signature);
  return recovered.has_value() && *recovered == signer;
}

}  // namespace quorum::crypto
