#include <quorum/storage/memory/storage.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace quorum::storage {

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  spdlog::debug("Using in-memory store for '{}'", path);
  return storage<memory_storage_tag>{};
}

void storage<memory_storage_tag>::remove(
    const quorum::schema::bytes_view_t& key) {
  entries.erase(quorum::schema::make_bytes(key));
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const quorum::schema::bytes_view_t& prefix) const {
  auto out = std::vector<key_value_entry_t>{};
  for (auto it = entries.lower_bound(quorum::schema::make_bytes(prefix));
       it != std::end(entries); ++it) {
    const auto& key = it->first;
    if (key.size() < prefix.size() ||
        !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
      break;
    }
    out.emplace_back(it->first, it->second);
  }
  return out;
}

void storage<memory_storage_tag>::commit(const write_batch& batch) {
  // Allocate every staged entry before the map is touched; the splice below
  // does not allocate.
  auto staged = decltype(entries){};
  for (const auto& [key, value] : batch.puts) {
    staged.insert_or_assign(key, value);
  }
  for (const auto& key : batch.deletes) {
    entries.erase(key);
  }
  while (!staged.empty()) {
    auto node = staged.extract(std::begin(staged));
    auto found = entries.find(node.key());
    if (found != std::end(entries)) {
      found->second = std::move(node.mapped());
    } else {
      entries.insert(std::move(node));
    }
  }
}

}  // namespace quorum::storage
