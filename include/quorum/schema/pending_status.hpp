#pragma once

#include <quorum/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: pending status.
// Off-chain lifecycle of a partially signed transfer. broadcast, failed and
// expired are terminal.
namespace quorum::schema {

enum class pending_status_t : uint8_t {
  pending = 0,
  ready = 1,
  broadcast = 2,
  failed = 3,
  expired = 4
};

inline constexpr auto kPendingStatusMappings =
    std::array{enum_mapping_t<pending_status_t>{
                   "pending", pending_status_t::pending},
               enum_mapping_t<pending_status_t>{
                   "ready", pending_status_t::ready},
               enum_mapping_t<pending_status_t>{
                   "broadcast", pending_status_t::broadcast},
               enum_mapping_t<pending_status_t>{
                   "failed", pending_status_t::failed},
               enum_mapping_t<pending_status_t>{
                   "expired", pending_status_t::expired}};

template <>
inline std::optional<pending_status_t> try_from_string<pending_status_t>(
    const std::string_view value) {
  return from_string(value, kPendingStatusMappings);
}

inline constexpr std::string_view to_string(const pending_status_t value) {
  return to_string(value, kPendingStatusMappings).value_or("unknown");
}

/// False for values outside the mapping table, e.g. from a foreign blob.
inline constexpr bool is_known(const pending_status_t value) {
  return to_string(value, kPendingStatusMappings).has_value();
}

inline constexpr bool is_terminal(const pending_status_t value) {
  return value == pending_status_t::broadcast ||
         value == pending_status_t::failed ||
         value == pending_status_t::expired;
}

}  // namespace quorum::schema
