#include <quorum/common/critical.hpp>
#include <quorum/storage/rocksdb/storage.hpp>

namespace quorum::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    quorum::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened pending transaction store at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::require_open() const {
  if (!database) {
    quorum::common::critical("RocksDB database is not initialized");
  }
}

void storage<rocksdb_storage_tag>::remove(
    const quorum::schema::bytes_view_t& key) {
  require_open();
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    quorum::common::critical("Failed to delete key from RocksDB",
                             status.ToString());
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const quorum::schema::bytes_view_t& prefix) const {
  require_open();

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = std::string_view{
      reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(detail::to_slice(prefix)); iterator->Valid();
       iterator->Next()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.emplace_back(detail::to_bytes(iterator->key()),
                         detail::to_bytes(iterator->value()));
  }
  if (!iterator->status().ok()) {
    quorum::common::critical("Failed to scan RocksDB prefix",
                             iterator->status().ToString());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit(const write_batch& batch) {
  require_open();
  if (batch.empty()) {
    return;
  }

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletes) {
    auto status = rocks_batch.Delete(detail::to_slice(key));
    if (!status.ok()) {
      quorum::common::critical("Failed staging delete", status.ToString());
    }
  }
  for (const auto& [key, value] : batch.puts) {
    auto status =
        rocks_batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!status.ok()) {
      quorum::common::critical("Failed staging put", status.ToString());
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, &rocks_batch);
  if (!status.ok()) {
    quorum::common::critical("Failed to commit write batch",
                             status.ToString());
  }
}

}  // namespace quorum::storage
