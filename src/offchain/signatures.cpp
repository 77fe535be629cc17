#include <quorum/blake3/hash.hpp>
#include <quorum/crypto/verify.hpp>
#include <quorum/offchain/signatures.hpp>
#include <quorum/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace quorum::offchain {

namespace {

using encoder_t = quorum::schema::encoding::encoder<
    quorum::schema::encoding::scale_encoder_tag>;

}  // namespace

quorum::schema::hash32_t compute_transaction_id(
    const quorum::schema::raw_transfer_t& raw) {
  auto encoded = encoder_t{}.encode(raw);
  return quorum::blake3::hash(quorum::schema::make_bytes_view(encoded));
}

std::vector<quorum::schema::address_t> normalize_signatures(
    quorum::schema::signed_transfer_t& transfer) {
  auto signers = std::vector<quorum::schema::address_t>{};
  auto kept = std::vector<quorum::schema::secp256k1_signature_t>{};
  for (const auto& signature : transfer.signatures) {
    auto signer = quorum::crypto::recover_address(transfer.tx_id, signature);
    if (!signer) {
      spdlog::warn("Dropping unrecoverable signature on {}",
                   quorum::schema::to_hex(transfer.tx_id));
      continue;
    }
    if (std::ranges::find(signers, *signer) != std::end(signers)) {
      continue;
    }
    signers.push_back(*signer);
    kept.push_back(signature);
  }
  transfer.signatures = std::move(kept);
  return signers;
}

std::vector<quorum::schema::address_t> merge_signatures(
    quorum::schema::signed_transfer_t& transfer,
    const std::vector<quorum::schema::secp256k1_signature_t>& incoming) {
  transfer.signatures.insert(std::end(transfer.signatures),
                             std::begin(incoming), std::end(incoming));
  return normalize_signatures(transfer);
}

quorum::schema::pending_status_t derive_status(const std::size_t signer_count,
                                               const uint32_t threshold) {
  return signer_count >= threshold ? quorum::schema::pending_status_t::ready
                                   : quorum::schema::pending_status_t::pending;
}

}  // namespace quorum::offchain
