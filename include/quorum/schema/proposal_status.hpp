#pragma once

#include <quorum/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: proposal status.
// On-chain proposal lifecycle. Everything but `open` is terminal.
namespace quorum::schema {

enum class proposal_status_t : uint8_t {
  open = 0,
  completed = 1,
  cancelled = 2,
  expired = 3
};

inline constexpr auto kProposalStatusMappings =
    std::array{enum_mapping_t<proposal_status_t>{
                   "open", proposal_status_t::open},
               enum_mapping_t<proposal_status_t>{
                   "completed", proposal_status_t::completed},
               enum_mapping_t<proposal_status_t>{
                   "cancelled", proposal_status_t::cancelled},
               enum_mapping_t<proposal_status_t>{
                   "expired", proposal_status_t::expired}};

template <>
inline std::optional<proposal_status_t> try_from_string<proposal_status_t>(
    const std::string_view value) {
  return from_string(value, kProposalStatusMappings);
}

inline constexpr std::string_view to_string(const proposal_status_t value) {
  return to_string(value, kProposalStatusMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const proposal_status_t value) {
  return value != proposal_status_t::open;
}

}  // namespace quorum::schema
