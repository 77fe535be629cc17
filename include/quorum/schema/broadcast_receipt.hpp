#pragma once
#include <quorum/schema/primitives.hpp>
#include <string>

// Schema type: broadcast receipt.
// Transport answer to a broadcast: accepted with the network id, or rejected
// with the node's message.
namespace quorum::schema {

template <uint16_t Version>
struct broadcast_receipt;

template <>
struct broadcast_receipt<1> final {
  uint16_t version{1};
  bool accepted{};
  hash32_t tx_id{};
  std::string message;
};

using broadcast_receipt_t = broadcast_receipt<1>;

}  // namespace quorum::schema
