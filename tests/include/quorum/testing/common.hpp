#pragma once

#include <quorum/crypto/signing_key.hpp>
#include <quorum/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace quorum::testing {

inline quorum::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = quorum::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline quorum::schema::address_t make_address(const uint8_t seed) {
  auto address = quorum::schema::address_t{};
  address.fill(seed);
  return address;
}

/// Deterministic key; `seed` must be non-zero.
inline quorum::crypto::signing_key make_signing_key(const uint8_t seed) {
  auto private_key = quorum::schema::secp256k1_private_key_t{};
  private_key.back() = seed;
  return *quorum::crypto::signing_key::from_private_key(private_key);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace quorum::testing
