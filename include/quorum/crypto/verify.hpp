#pragma once

#include <quorum/schema/primitives.hpp>

#include <optional>

namespace quorum::crypto {

bool available();

/// Derive the uncompressed public key for a private scalar. std::nullopt when
/// the scalar is zero or not below the group order.
std::optional<quorum::schema::secp256k1_public_key_t> derive_public_key(
    const quorum::schema::secp256k1_private_key_t& private_key);

/// Account address: trailing 20 bytes of BLAKE3 over the 64-byte x || y.
quorum::schema::address_t address_of(
    const quorum::schema::secp256k1_public_key_t& public_key);

std::optional<quorum::schema::secp256k1_public_key_t> recover_public_key(
    const quorum::schema::hash32_t& digest,
    const quorum::schema::secp256k1_signature_t& signature);

std::optional<quorum::schema::address_t> recover_address(
    const quorum::schema::hash32_t& digest,
    const quorum::schema::secp256k1_signature_t& signature);

bool verify_signature(const quorum::schema::hash32_t& digest,
                      const quorum::schema::address_t& signer,
                      const quorum::schema::secp256k1_signature_t& signature);

}  // namespace quorum::crypto
