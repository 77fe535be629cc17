#pragma once

#include <quorum/crypto/signing_key.hpp>
#include <quorum/offchain/network.hpp>
#include <quorum/schema/asset_ref.hpp>
#include <quorum/schema/coordinator_result.hpp>
#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/pending_transaction.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/transaction_error_code.hpp>
#include <quorum/storage/storage.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace quorum::offchain {

inline constexpr std::string_view kCodespace{"quorum.offchain"};
// Expiration the node assigns to a freshly built transaction.
inline constexpr quorum::schema::duration_milliseconds_t
    kDefaultExpirationWindowMs = 60'000;
// Extra time granted so the other custodians can sign.
inline constexpr quorum::schema::duration_milliseconds_t
    kDefaultExpirationExtensionMs = 300'000;
inline constexpr uint64_t kDefaultTokenFeeLimit = 100'000'000;

struct coordinator_options final {
  /// Multi-key account the transfers are sent from.
  quorum::schema::address_t account{};
  quorum::schema::duration_milliseconds_t expiration_window_ms{
      kDefaultExpirationWindowMs};
  quorum::schema::duration_milliseconds_t expiration_extension_ms{
      kDefaultExpirationExtensionMs};
  uint64_t token_fee_limit{kDefaultTokenFeeLimit};
  /// Clock for local housekeeping when `network_t::now` fails. Defaults to
  /// the system clock when empty.
  std::function<quorum::schema::timestamp_milliseconds_t()> local_clock;
};

/// Local custodian's view of the partially signed transfers of one multi-key
/// account.
///
/// Records are persisted under `QUORUM|PENDING|` and reloaded at
/// construction. Every mutation is committed to storage before the in-memory
/// view changes. Nothing reaches the network except through `broadcast` and
/// `reconcile`.
///
/// One instance per store; calls are serialized internally. The lock is not
/// held across network callbacks, so a callback may call back into the
/// coordinator.
template <typename StorageTag>
class coordinator final {
 public:
  using storage_t = quorum::storage::storage<StorageTag>;

  coordinator(storage_t& storage,
              quorum::crypto::signing_key key,
              network_t network,
              coordinator_options options);

  coordinator(const coordinator&) = delete;
  coordinator& operator=(const coordinator&) = delete;
  coordinator(coordinator&&) = delete;
  coordinator& operator=(coordinator&&) = delete;

  /// Build a transfer from the configured account, sign it with the local key
  /// and store it. The threshold is read from the account permission once,
  /// here, and never re-read.
  quorum::schema::coordinator_result_t create(
      const quorum::schema::address_t& to,
      const quorum::schema::amount_t& amount,
      const quorum::schema::asset_ref_t& asset,
      std::optional<std::string> description = std::nullopt);

  /// Add the local custodian's signature.
  quorum::schema::coordinator_result_t sign(const quorum::schema::hash32_t& id);

  /// Merge an exported record. A known transaction id gets the union of both
  /// signature sets; an unknown one is inserted.
  quorum::schema::coordinator_result_t import_and_merge(
      const quorum::schema::bytes_view_t& blob);

  /// Submit once enough distinct signers are present and the payload has not
  /// expired. A transport rejection is stored in the record.
  quorum::schema::coordinator_result_t broadcast(
      const quorum::schema::hash32_t& id);

  /// Serialized record for out-of-band transport.
  std::optional<quorum::schema::bytes_t> export_record(
      const quorum::schema::hash32_t& id) const;

  quorum::schema::coordinator_result_t remove(
      const quorum::schema::hash32_t& id);

  /// Drop records the network reports as settled and mark records past their
  /// expiry as expired. Expiry is decided locally; a failed settlement lookup
  /// only skips the settlement check for that record.
  void reconcile();

  std::optional<quorum::schema::pending_transaction_t> get(
      const quorum::schema::hash32_t& id) const;

  /// All records, newest first.
  std::vector<quorum::schema::pending_transaction_t> list() const;

  bool has_signed(const quorum::schema::hash32_t& id) const;

  const quorum::schema::address_t& local_address() const;

 private:
  using encoder_t = quorum::schema::encoding::encoder<
      quorum::schema::encoding::scale_encoder_tag>;

  void load_persisted_records();
  void persist(const quorum::schema::pending_transaction_t& record);
  quorum::schema::hash32_t make_pending_id(
      const quorum::schema::hash32_t& tx_id,
      quorum::schema::timestamp_milliseconds_t now);
  std::optional<quorum::schema::hash32_t> find_by_transaction_id(
      const quorum::schema::hash32_t& tx_id) const;
  quorum::schema::timestamp_milliseconds_t local_now() const;

  mutable std::mutex mutex_;
  storage_t& storage_;
  encoder_t encoder_;
  quorum::crypto::signing_key key_;
  network_t network_;
  coordinator_options options_;
  std::map<quorum::schema::hash32_t, quorum::schema::pending_transaction_t>
      records_;
  uint64_t sequence_{};
  std::set<quorum::schema::hash32_t> broadcasts_in_flight_;
};

}  // namespace quorum::offchain
