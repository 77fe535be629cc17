#pragma once

#include <quorum/schema/pending_status.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/raw_transfer.hpp>
#include <quorum/schema/signed_transfer.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace quorum::offchain {

/// Network transaction id: BLAKE3 of the SCALE-encoded unsigned transfer.
quorum::schema::hash32_t compute_transaction_id(
    const quorum::schema::raw_transfer_t& raw);

/// Drop signatures that do not recover against `transfer.tx_id`, keep the
/// first signature per recovered address, and return the signer addresses in
/// signature order.
std::vector<quorum::schema::address_t> normalize_signatures(
    quorum::schema::signed_transfer_t& transfer);

/// Append `incoming` signatures to `transfer` and normalize the result.
std::vector<quorum::schema::address_t> merge_signatures(
    quorum::schema::signed_transfer_t& transfer,
    const std::vector<quorum::schema::secp256k1_signature_t>& incoming);

/// pending below threshold, ready at or above it.
quorum::schema::pending_status_t derive_status(std::size_t signer_count,
                                               uint32_t threshold);

}  // namespace quorum::offchain
