#pragma once

#include <quorum/schema/primitives.hpp>
#include <string_view>

// Key layout of the coordinator's local store.
namespace quorum::schema::key {

inline constexpr std::string_view kPendingKeyPrefix{"QUORUM|PENDING|"};

template <typename Encoder, typename T>
quorum::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // Raw prefix bytes followed by the SCALE encoding of the id, so a prefix
  // scan over `prefix` yields every record of the keyspace.
  auto key = quorum::schema::make_bytes(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
quorum::schema::bytes_t make_pending_key(Encoder& encoder,
                                         const quorum::schema::hash32_t& id) {
  return make_prefixed_key(encoder, kPendingKeyPrefix, id);
}

}  // namespace quorum::schema::key
