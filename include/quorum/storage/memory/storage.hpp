#pragma once
#include <quorum/storage/storage.hpp>
#include <map>
#include <string_view>

namespace quorum::storage {

struct memory_storage_tag {};

/// Process-local backend with the same surface as the RocksDB one. Used
/// where durability is not wanted (tests, dry runs).
template <>
struct storage<memory_storage_tag> final {
  std::map<quorum::schema::bytes_t, quorum::schema::bytes_t> entries;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const quorum::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const quorum::schema::bytes_view_t& key,
           const T& value);

  void remove(const quorum::schema::bytes_view_t& key);
  std::vector<key_value_entry_t> list_by_prefix(
      const quorum::schema::bytes_view_t& prefix) const;
  void commit(const write_batch& batch);
};

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<memory_storage_tag>::get(
    Encoder& encoder,
    const quorum::schema::bytes_view_t& key) const {
  auto found = entries.find(quorum::schema::make_bytes(key));
  if (found == std::end(entries)) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      quorum::schema::make_bytes_view(found->second))};
}

template <typename T, typename Encoder>
void storage<memory_storage_tag>::put(Encoder& encoder,
                                      const quorum::schema::bytes_view_t& key,
                                      const T& value) {
  entries.insert_or_assign(quorum::schema::make_bytes(key),
                           encoder.encode(value));
}

}  // namespace quorum::storage
