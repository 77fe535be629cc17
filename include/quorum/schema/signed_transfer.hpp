#pragma once
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/raw_transfer.hpp>
#include <vector>

namespace quorum::schema {

template <uint16_t Version>
struct signed_transfer;

template <>
struct signed_transfer<1> final {
  uint16_t version{1};
  raw_transfer_t raw;
  hash32_t tx_id{};
  std::vector<secp256k1_signature_t> signatures;
};

using signed_transfer_t = signed_transfer<1>;

}  // namespace quorum::schema
