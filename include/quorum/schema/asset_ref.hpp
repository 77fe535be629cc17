#pragma once
#include <quorum/schema/primitives.hpp>
#include <variant>

namespace quorum::schema {

template <uint16_t Version>
struct asset_ref_native;

// The chain's own coin; `symbol` is informational.
template <>
struct asset_ref_native<1> final {
  uint16_t version{1};
  bytes_t symbol;
};

using asset_ref_native_t = asset_ref_native<1>;

template <uint16_t Version>
struct asset_ref_token;

template <>
struct asset_ref_token<1> final {
  uint16_t version{1};
  address_t contract{};
};

using asset_ref_token_t = asset_ref_token<1>;

using asset_ref_t = std::variant<asset_ref_native_t, asset_ref_token_t>;

inline bool is_token(const asset_ref_t& asset) {
  return std::holds_alternative<asset_ref_token_t>(asset);
}

}  // namespace quorum::schema
