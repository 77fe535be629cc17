#pragma once
#include <quorum/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: transaction info.
// Settlement lookup for a network transaction id. A transaction counts as
// settled once it carries a block number or a receipt.
namespace quorum::schema {

template <uint16_t Version>
struct transaction_info;

template <>
struct transaction_info<1> final {
  uint16_t version{1};
  hash32_t tx_id{};
  std::optional<uint64_t> block_number;
  bool has_receipt{};
};

using transaction_info_t = transaction_info<1>;

inline bool is_settled(const transaction_info_t& info) {
  return info.block_number.has_value() || info.has_receipt;
}

}  // namespace quorum::schema
