#pragma once
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/proposal_status.hpp>
#include <cstdint>

namespace quorum::schema {

template <uint16_t Version>
struct proposal_state;

template <>
struct proposal_state<1> final {
  uint16_t version{1};
  uint64_t id{};
  address_t to{};
  amount_t amount;
  proposal_status_t status{proposal_status_t::open};
  uint32_t approval_count{};
  timestamp_seconds_t created_at{};
};

using proposal_state_t = proposal_state<1>;

/// `executed` as exposed by the host contract: any terminal outcome.
inline bool is_executed(const proposal_state_t& proposal) {
  return is_terminal(proposal.status);
}

}  // namespace quorum::schema
