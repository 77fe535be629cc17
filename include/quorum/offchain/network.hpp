#pragma once

#include <quorum/schema/block_reference.hpp>
#include <quorum/schema/broadcast_receipt.hpp>
#include <quorum/schema/custodian_roster.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/signed_transfer.hpp>
#include <quorum/schema/transaction_info.hpp>

#include <functional>
#include <optional>

namespace quorum::offchain {

/// Transport to the chain the multi-key account lives on. Any callback may
/// throw; the coordinator treats a throw as a transport failure.
struct network_t final {
  /// Active permission of `account`: its signer roster and threshold.
  /// std::nullopt when the account does not exist.
  std::function<std::optional<quorum::schema::custodian_roster_t>(
      const quorum::schema::address_t& account)>
      account_permission;

  std::function<quorum::schema::block_reference_t()> latest_block;

  std::function<quorum::schema::broadcast_receipt_t(
      const quorum::schema::signed_transfer_t& transfer)>
      broadcast;

  /// std::nullopt when the node has never seen the transaction.
  std::function<std::optional<quorum::schema::transaction_info_t>(
      const quorum::schema::hash32_t& tx_id)>
      transaction_info;

  /// Wall clock in milliseconds.
  std::function<quorum::schema::timestamp_milliseconds_t()> now;
};

}  // namespace quorum::offchain
