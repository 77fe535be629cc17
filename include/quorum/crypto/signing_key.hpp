#pragma once

#include <quorum/schema/primitives.hpp>

#include <optional>

namespace quorum::crypto {

/// Local custodian key. Produces recoverable low-s secp256k1 signatures over
/// 32-byte digests.
class signing_key final {
 public:
  static std::optional<signing_key> generate();
  static std::optional<signing_key> from_private_key(
      const quorum::schema::secp256k1_private_key_t& private_key);

  const quorum::schema::secp256k1_private_key_t& private_key() const;
  const quorum::schema::secp256k1_public_key_t& public_key() const;
  const quorum::schema::address_t& address() const;

  std::optional<quorum::schema::secp256k1_signature_t> sign(
      const quorum::schema::hash32_t& digest) const;

 private:
  signing_key(const quorum::schema::secp256k1_private_key_t& private_key,
              const quorum::schema::secp256k1_public_key_t& public_key);

  quorum::schema::secp256k1_private_key_t private_key_;
  quorum::schema::secp256k1_public_key_t public_key_;
  quorum::schema::address_t address_;
};

}  // namespace quorum::crypto
