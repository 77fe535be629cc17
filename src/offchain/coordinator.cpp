#include <quorum/blake3/hash.hpp>
#include <quorum/common/validation.hpp>
#include <quorum/offchain/coordinator.hpp>
#include <quorum/offchain/signatures.hpp>
#include <quorum/schema/key/coordinator_keys.hpp>
#include <quorum/storage/memory/storage.hpp>
#include <quorum/storage/rocksdb/storage.hpp>

#include <boost/endian/conversion.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstring>
#include <exception>
#include <iterator>
#include <set>

using namespace quorum::schema;

namespace {

std::string_view log_for(const transaction_error_code code) {
  using enum transaction_error_code;
  switch (code) {
    case zero_address:
      return "destination is the zero address";
    case zero_amount:
      return "amount must be positive";
    case authorization_denied:
      return "local key is not in the account permission";
    case pending_missing:
      return "pending transaction not found";
    case already_signed:
      return "local key already signed";
    case invalid_import:
      return "invalid pending transaction blob";
    case insufficient_signatures:
      return "not enough signatures";
    case pending_expired:
      return "transaction expired";
    case pending_terminal:
      return "pending transaction already finalized";
    case broadcast_rejected:
      return "broadcast rejected";
    case account_missing:
      return "account permission unavailable";
    case transport_failed:
      return "network request failed";
    case signing_failed:
      return "signing failed";
    default:
      return "operation rejected";
  }
}

coordinator_result_t make_rejection(
    const transaction_error_code code,
    std::string info,
    std::optional<pending_transaction_t> record = std::nullopt) {
  auto result = coordinator_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log_for(code)};
  result.info = std::move(info);
  result.codespace = std::string{quorum::offchain::kCodespace};
  result.record = std::move(record);
  return result;
}

coordinator_result_t make_success(pending_transaction_t record) {
  auto result = coordinator_result_t{};
  result.codespace = std::string{quorum::offchain::kCodespace};
  result.record = std::move(record);
  return result;
}

struct open_record final {
  hash32_t id;
  hash32_t tx_id;
  timestamp_milliseconds_t expires_at{};
};

bool is_closed(const pending_status_t status) {
  return status == pending_status_t::broadcast ||
         status == pending_status_t::expired;
}

bool is_open(const pending_status_t status) {
  return status == pending_status_t::pending ||
         status == pending_status_t::ready;
}

// Low two bytes of the big-endian block number.
bytes_t make_ref_block_bytes(const uint64_t number) {
  auto big = boost::endian::native_to_big(number);
  auto raw = std::array<uint8_t, sizeof(big)>{};
  std::memcpy(raw.data(), &big, sizeof(big));
  return bytes_t{std::end(raw) - 2, std::end(raw)};
}

// Bytes 8..16 of the block hash.
bytes_t make_ref_block_hash(const hash32_t& hash) {
  return bytes_t{std::begin(hash) + 8, std::begin(hash) + 16};
}

}  // namespace

namespace quorum::offchain {

template <typename StorageTag>
coordinator<StorageTag>::coordinator(storage_t& storage,
                                     quorum::crypto::signing_key key,
                                     network_t network,
                                     coordinator_options options)
    : storage_{storage},
      key_{std::move(key)},
      network_{std::move(network)},
      options_{std::move(options)} {
  load_persisted_records();
}

template <typename StorageTag>
void coordinator<StorageTag>::load_persisted_records() {
  auto prefix = make_bytes(quorum::schema::key::kPendingKeyPrefix);
  auto entries = storage_.list_by_prefix(make_bytes_view(prefix));
  for (const auto& [key, value] : entries) {
    auto record =
        encoder_.try_decode<pending_transaction_t>(make_bytes_view(value));
    if (!record || record->version != 1) {
      spdlog::warn("Skipping unreadable pending record at key {}", to_hex(key));
      continue;
    }
    auto id = record->id;
    records_.insert_or_assign(id, std::move(*record));
  }
  spdlog::info("Loaded {} pending transaction(s)", records_.size());
}

template <typename StorageTag>
void coordinator<StorageTag>::persist(const pending_transaction_t& record) {
  auto batch = quorum::storage::write_batch{};
  batch.puts.emplace_back(quorum::schema::key::make_pending_key(encoder_, record.id),
                          encoder_.encode(record));
  storage_.commit(batch);
  records_.insert_or_assign(record.id, record);
}

template <typename StorageTag>
hash32_t coordinator<StorageTag>::make_pending_id(
    const hash32_t& tx_id,
    const timestamp_milliseconds_t now) {
  auto salt = bytes_t{};
  encoder_.encode(now, salt);
  encoder_.encode(++sequence_, salt);
  return quorum::blake3::hasher{}
      .update(std::string_view{"quorum.pending"})
      .update(bytes_view_t{tx_id})
      .update(bytes_view_t{key_.address()})
      .update(make_bytes_view(salt))
      .finalize();
}

template <typename StorageTag>
std::optional<hash32_t> coordinator<StorageTag>::find_by_transaction_id(
    const hash32_t& tx_id) const {
  for (const auto& [id, record] : records_) {
    if (record.tx_id == tx_id) {
      return id;
    }
  }
  return std::nullopt;
}

template <typename StorageTag>
timestamp_milliseconds_t coordinator<StorageTag>::local_now() const {
  if (options_.local_clock) {
    return options_.local_clock();
  }
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

template <typename StorageTag>
coordinator_result_t coordinator<StorageTag>::create(
    const address_t& to,
    const amount_t& amount,
    const asset_ref_t& asset,
    std::optional<std::string> description) {
  if (auto invalid = quorum::common::validate_transfer(to, amount)) {
    return make_rejection(*invalid, "");
  }
  if (auto token = std::get_if<asset_ref_token_t>(&asset);
      token != nullptr && quorum::common::is_zero_address(token->contract)) {
    return make_rejection(transaction_error_code::zero_address,
                          "token contract is the zero address");
  }

  auto permission = std::optional<custodian_roster_t>{};
  try {
    permission = network_.account_permission(options_.account);
  } catch (const std::exception& e) {
    spdlog::error("Account permission lookup failed: {}", e.what());
    return make_rejection(transaction_error_code::transport_failed, e.what());
  }
  if (!permission) {
    return make_rejection(transaction_error_code::account_missing,
                          to_hex(options_.account));
  }
  auto roster_error = std::string{};
  if (!quorum::common::validate_roster(*permission, roster_error)) {
    return make_rejection(transaction_error_code::account_missing,
                          roster_error);
  }
  if (!quorum::common::is_custodian(*permission, key_.address())) {
    return make_rejection(transaction_error_code::authorization_denied,
                          to_hex(key_.address()));
  }

  auto block = block_reference_t{};
  auto now = timestamp_milliseconds_t{};
  try {
    block = network_.latest_block();
    now = network_.now();
  } catch (const std::exception& e) {
    spdlog::error("Latest block lookup failed: {}", e.what());
    return make_rejection(transaction_error_code::transport_failed, e.what());
  }

  auto raw = raw_transfer_t{};
  raw.ref_block_bytes = make_ref_block_bytes(block.number);
  raw.ref_block_hash = make_ref_block_hash(block.hash);
  raw.expiration = quorum::common::expiry_deadline(
      quorum::common::expiry_deadline(block.timestamp,
                                      options_.expiration_window_ms),
      options_.expiration_extension_ms);
  raw.timestamp = now;
  raw.owner = options_.account;
  raw.to = to;
  raw.amount = amount;
  raw.asset = asset;
  raw.fee_limit = is_token(asset) ? options_.token_fee_limit : 0;

  auto payload = signed_transfer_t{};
  payload.raw = raw;
  payload.tx_id = compute_transaction_id(raw);
  auto signature = key_.sign(payload.tx_id);
  if (!signature) {
    return make_rejection(transaction_error_code::signing_failed,
                          to_hex(payload.tx_id));
  }
  payload.signatures.push_back(*signature);

  auto lock = std::scoped_lock{mutex_};
  auto record = pending_transaction_t{};
  record.id = make_pending_id(payload.tx_id, now);
  record.tx_id = payload.tx_id;
  record.signers = normalize_signatures(payload);
  record.payload = std::move(payload);
  record.from = options_.account;
  record.to = to;
  record.amount = amount;
  record.asset = asset;
  record.threshold = permission->threshold;
  record.created_at = now;
  record.expires_at = raw.expiration;
  record.status = derive_status(record.signers.size(), record.threshold);
  record.description = std::move(description);

  persist(record);
  spdlog::info("Created pending transaction {} ({}/{} signatures)",
               to_hex(record.id), record.signers.size(), record.threshold);
  return make_success(std::move(record));
}

template <typename StorageTag>
coordinator_result_t coordinator<StorageTag>::sign(const hash32_t& id) {
  auto lock = std::scoped_lock{mutex_};
  auto found = records_.find(id);
  if (found == std::end(records_)) {
    return make_rejection(transaction_error_code::pending_missing, to_hex(id));
  }
  auto record = found->second;
  if (is_closed(record.status)) {
    return make_rejection(transaction_error_code::pending_terminal,
                          std::string{to_string(record.status)}, record);
  }
  if (std::ranges::find(record.signers, key_.address()) !=
      std::end(record.signers)) {
    return make_rejection(transaction_error_code::already_signed,
                          to_hex(key_.address()), record);
  }
  auto signature = key_.sign(record.tx_id);
  if (!signature) {
    return make_rejection(transaction_error_code::signing_failed,
                          to_hex(record.tx_id), record);
  }
  record.payload.signatures.push_back(*signature);
  record.signers = normalize_signatures(record.payload);
  if (is_open(record.status)) {
    record.status = derive_status(record.signers.size(), record.threshold);
  }
  persist(record);
  spdlog::info("Signed pending transaction {} ({}/{} signatures)", to_hex(id),
               record.signers.size(), record.threshold);
  return make_success(std::move(record));
}

template <typename StorageTag>
coordinator_result_t coordinator<StorageTag>::import_and_merge(
    const bytes_view_t& blob) {
  auto lock = std::scoped_lock{mutex_};
  auto imported = encoder_.try_decode<pending_transaction_t>(blob);
  if (!imported) {
    return make_rejection(transaction_error_code::invalid_import,
                          "malformed blob");
  }
  if (imported->version != 1 || imported->payload.version != 1 ||
      imported->payload.raw.version != 1) {
    return make_rejection(transaction_error_code::invalid_import,
                          "unsupported record version");
  }
  if (!is_known(imported->status)) {
    return make_rejection(transaction_error_code::invalid_import,
                          "unknown record status");
  }
  if (imported->threshold == 0) {
    return make_rejection(transaction_error_code::invalid_import,
                          "threshold must be at least 1");
  }
  if (compute_transaction_id(imported->payload.raw) !=
          imported->payload.tx_id ||
      imported->tx_id != imported->payload.tx_id) {
    return make_rejection(transaction_error_code::invalid_import,
                          "transaction id does not match payload");
  }

  if (auto existing_id = find_by_transaction_id(imported->tx_id)) {
    auto record = records_.at(*existing_id);
    if (is_closed(record.status)) {
      return make_rejection(transaction_error_code::pending_terminal,
                            std::string{to_string(record.status)}, record);
    }
    record.signers =
        merge_signatures(record.payload, imported->payload.signatures);
    if (is_open(record.status)) {
      record.status = derive_status(record.signers.size(), record.threshold);
    }
    persist(record);
    spdlog::info("Merged signatures into {} ({}/{} signatures)",
                 to_hex(record.id), record.signers.size(), record.threshold);
    return make_success(std::move(record));
  }

  if (records_.contains(imported->id)) {
    return make_rejection(transaction_error_code::invalid_import,
                          "record id already used by another transaction");
  }
  auto record = std::move(*imported);
  const auto& raw = record.payload.raw;
  record.from = raw.owner;
  record.to = raw.to;
  record.amount = raw.amount;
  record.asset = raw.asset;
  record.expires_at = raw.expiration;
  record.signers = normalize_signatures(record.payload);
  if (is_open(record.status)) {
    record.status = derive_status(record.signers.size(), record.threshold);
  }
  persist(record);
  spdlog::info("Imported pending transaction {} ({}/{} signatures)",
               to_hex(record.id), record.signers.size(), record.threshold);
  return make_success(std::move(record));
}

template <typename StorageTag>
coordinator_result_t coordinator<StorageTag>::broadcast(const hash32_t& id) {
  auto lock = std::unique_lock{mutex_};
  auto found = records_.find(id);
  if (found == std::end(records_)) {
    return make_rejection(transaction_error_code::pending_missing, to_hex(id));
  }
  const auto& record = found->second;
  if (is_closed(record.status)) {
    return make_rejection(transaction_error_code::pending_terminal,
                          std::string{to_string(record.status)}, record);
  }
  if (record.signers.size() < record.threshold) {
    return make_rejection(
        transaction_error_code::insufficient_signatures,
        fmt::format("{}/{}", record.signers.size(), record.threshold), record);
  }
  if (!broadcasts_in_flight_.insert(id).second) {
    return make_rejection(transaction_error_code::pending_terminal,
                          "broadcast in progress", record);
  }
  const auto payload = record.payload;
  const auto expires_at = record.expires_at;
  lock.unlock();

  auto now = std::optional<timestamp_milliseconds_t>{};
  auto clock_error = std::string{};
  try {
    now = network_.now();
  } catch (const std::exception& e) {
    clock_error = e.what();
  }
  const auto expired = now && quorum::common::is_expired(expires_at, *now);
  auto receipt = broadcast_receipt_t{};
  if (now && !expired) {
    try {
      receipt = network_.broadcast(payload);
    } catch (const std::exception& e) {
      receipt.accepted = false;
      receipt.message = e.what();
    }
  }

  lock.lock();
  broadcasts_in_flight_.erase(id);
  found = records_.find(id);
  if (found == std::end(records_)) {
    spdlog::warn("Pending transaction {} was deleted during broadcast",
                 to_hex(id));
    return make_rejection(transaction_error_code::pending_missing, to_hex(id));
  }
  auto updated = found->second;
  if (!now) {
    return make_rejection(transaction_error_code::transport_failed,
                          clock_error, std::move(updated));
  }
  if (expired) {
    return make_rejection(transaction_error_code::pending_expired,
                          fmt::format("expired at {}", expires_at),
                          std::move(updated));
  }
  if (!receipt.accepted) {
    spdlog::warn("Broadcast of {} rejected: {}", to_hex(id), receipt.message);
    updated.status = pending_status_t::failed;
    updated.error_message = receipt.message;
    persist(updated);
    return make_rejection(transaction_error_code::broadcast_rejected,
                          receipt.message, std::move(updated));
  }

  updated.status = pending_status_t::broadcast;
  updated.broadcast_tx_id = receipt.tx_id;
  updated.error_message.reset();
  persist(updated);
  spdlog::info("Broadcast pending transaction {} as {}", to_hex(id),
               to_hex(receipt.tx_id));
  return make_success(std::move(updated));
}

template <typename StorageTag>
std::optional<bytes_t> coordinator<StorageTag>::export_record(
    const hash32_t& id) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = records_.find(id);
  if (found == std::end(records_)) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  return encoder.encode(found->second);
}

template <typename StorageTag>
coordinator_result_t coordinator<StorageTag>::remove(const hash32_t& id) {
  auto lock = std::scoped_lock{mutex_};
  auto found = records_.find(id);
  if (found == std::end(records_)) {
    return make_rejection(transaction_error_code::pending_missing, to_hex(id));
  }
  auto batch = quorum::storage::write_batch{};
  batch.deletes.push_back(quorum::schema::key::make_pending_key(encoder_, id));
  storage_.commit(batch);
  auto record = std::move(found->second);
  records_.erase(found);
  spdlog::info("Deleted pending transaction {}", to_hex(id));
  return make_success(std::move(record));
}

template <typename StorageTag>
void coordinator<StorageTag>::reconcile() {
  auto lock = std::unique_lock{mutex_};
  auto open = std::vector<open_record>{};
  for (const auto& [id, record] : records_) {
    if (is_open(record.status)) {
      open.push_back(open_record{
          .id = id, .tx_id = record.tx_id, .expires_at = record.expires_at});
    }
  }
  lock.unlock();

  auto now = timestamp_milliseconds_t{};
  try {
    now = network_.now();
  } catch (const std::exception& e) {
    spdlog::warn("Network clock unavailable, using local clock: {}", e.what());
    now = local_now();
  }

  auto settled = std::set<hash32_t>{};
  auto expired = std::set<hash32_t>{};
  for (const auto& [id, tx_id, expires_at] : open) {
    auto info = std::optional<transaction_info_t>{};
    try {
      info = network_.transaction_info(tx_id);
    } catch (const std::exception& e) {
      spdlog::warn("Settlement lookup for {} failed: {}", to_hex(id),
                   e.what());
    }
    if (info && is_settled(*info)) {
      settled.insert(id);
    } else if (quorum::common::is_expired(expires_at, now)) {
      expired.insert(id);
    }
  }

  lock.lock();
  auto batch = quorum::storage::write_batch{};
  auto updates = std::vector<pending_transaction_t>{};
  for (const auto& id : settled) {
    if (records_.contains(id)) {
      batch.deletes.push_back(
          quorum::schema::key::make_pending_key(encoder_, id));
    }
  }
  for (const auto& id : expired) {
    auto found = records_.find(id);
    // Skip records that moved on while the lock was released.
    if (found == std::end(records_) || !is_open(found->second.status)) {
      continue;
    }
    auto updated = found->second;
    updated.status = pending_status_t::expired;
    batch.puts.emplace_back(
        quorum::schema::key::make_pending_key(encoder_, id),
        encoder_.encode(updated));
    updates.push_back(std::move(updated));
  }
  if (batch.empty()) {
    return;
  }
  storage_.commit(batch);
  for (const auto& id : settled) {
    records_.erase(id);
  }
  for (auto& record : updates) {
    auto id = record.id;
    records_.insert_or_assign(id, std::move(record));
  }
  spdlog::info("Reconciled: {} settled, {} expired", batch.deletes.size(),
               updates.size());
}

template <typename StorageTag>
std::optional<pending_transaction_t> coordinator<StorageTag>::get(
    const hash32_t& id) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = records_.find(id);
  if (found == std::end(records_)) {
    return std::nullopt;
  }
  return found->second;
}

template <typename StorageTag>
std::vector<pending_transaction_t> coordinator<StorageTag>::list() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<pending_transaction_t>{};
  out.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    out.push_back(record);
  }
  std::ranges::stable_sort(out, [](const auto& lhs, const auto& rhs) {
    return lhs.created_at > rhs.created_at;
  });
  return out;
}

template <typename StorageTag>
bool coordinator<StorageTag>::has_signed(const hash32_t& id) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = records_.find(id);
  if (found == std::end(records_)) {
    return false;
  }
  return std::ranges::find(found->second.signers, key_.address()) !=
         std::end(found->second.signers);
}

template <typename StorageTag>
const address_t& coordinator<StorageTag>::local_address() const {
  return key_.address();
}

template class coordinator<quorum::storage::rocksdb_storage_tag>;
template class coordinator<quorum::storage::memory_storage_tag>;

}  // namespace quorum::offchain
