#pragma once
#include <quorum/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace quorum::storage {

using key_value_entry_t =
    std::pair<quorum::schema::bytes_t, quorum::schema::bytes_t>;

/// Puts and deletes applied together or not at all.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<quorum::schema::bytes_t> deletes;

  bool empty() const { return puts.empty() && deletes.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const quorum::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const quorum::schema::bytes_view_t& key,
           const T& value);

  /// Delete key. Missing keys are not an error.
  void remove(const quorum::schema::bytes_view_t& key);

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const quorum::schema::bytes_view_t& prefix) const;

  /// Atomically apply every put and delete in the batch.
  void commit(const write_batch& batch);
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace quorum::storage
