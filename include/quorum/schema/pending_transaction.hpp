#pragma once
#include <quorum/schema/asset_ref.hpp>
#include <quorum/schema/pending_status.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/signed_transfer.hpp>
#include <optional>
#include <string>
#include <vector>

namespace quorum::schema {

template <uint16_t Version>
struct pending_transaction;

/// Local record of one partially signed transfer. `id` is assigned by the
/// coordinator that created it; `tx_id` is fixed by the unsigned payload.
/// `signers` is always re-derived from `payload.signatures`.
template <>
struct pending_transaction<1> final {
  uint16_t version{1};
  hash32_t id{};
  hash32_t tx_id{};
  signed_transfer_t payload;
  address_t from{};
  address_t to{};
  amount_t amount;
  asset_ref_t asset{};
  uint32_t threshold{};
  std::vector<address_t> signers;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t expires_at{};
  pending_status_t status{pending_status_t::pending};
  std::optional<std::string> description;
  std::optional<std::string> error_message;
  std::optional<hash32_t> broadcast_tx_id;
};

using pending_transaction_t = pending_transaction<1>;

}  // namespace quorum::schema
