#pragma once
#include <quorum/schema/asset_ref.hpp>
#include <quorum/schema/primitives.hpp>
#include <cstdint>

// Schema type: raw transfer.
// Unsigned transfer from the multi-key account. Its SCALE encoding is what
// every custodian signs, and its BLAKE3 hash is the network transaction id.
namespace quorum::schema {

template <uint16_t Version>
struct raw_transfer;

template <>
struct raw_transfer<1> final {
  uint16_t version{1};
  bytes_t ref_block_bytes;
  bytes_t ref_block_hash;
  timestamp_milliseconds_t expiration{};
  timestamp_milliseconds_t timestamp{};
  address_t owner{};
  address_t to{};
  amount_t amount;
  asset_ref_t asset{};
  uint64_t fee_limit{};
};

using raw_transfer_t = raw_transfer<1>;

}  // namespace quorum::schema
