#pragma once
#include <quorum/schema/primitives.hpp>
#include <cstdint>

// Schema type: block reference.
// Latest block header fields a raw transfer is anchored to.
namespace quorum::schema {

template <uint16_t Version>
struct block_reference;

template <>
struct block_reference<1> final {
  uint16_t version{1};
  uint64_t number{};
  hash32_t hash{};
  timestamp_milliseconds_t timestamp{};
};

using block_reference_t = block_reference<1>;

}  // namespace quorum::schema
