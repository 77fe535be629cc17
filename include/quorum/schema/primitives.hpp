#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace quorum::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

// r || s || v, v is the recovery id (0/1, 27/28 accepted on input).
using secp256k1_signature_t = std::array<uint8_t, 65>;
// 0x04 || x || y
using secp256k1_public_key_t = std::array<uint8_t, 65>;
using secp256k1_private_key_t = std::array<uint8_t, 32>;

// Network prefix carried by base58 account addresses on the target chain.
inline constexpr uint8_t kAddressNetworkPrefix = 0x41;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_view_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Parse a 20-byte account address from hex. Accepts an optional `0x`
/// prefix and the 21-byte network form that starts with `41`.
std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_zero_address();

/// Parse a non-negative decimal integer in the smallest token unit.
std::optional<amount_t> try_make_amount(const std::string_view& decimal);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);

}  // namespace quorum::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
