#pragma once
#include <quorum/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: custodian roster.
// Ordered custodian addresses and the number of distinct approvals or
// signatures a transfer needs.
namespace quorum::schema {

template <uint16_t Version>
struct custodian_roster;

template <>
struct custodian_roster<1> final {
  uint16_t version{1};
  std::vector<address_t> custodians;
  uint32_t threshold{};
};

using custodian_roster_t = custodian_roster<1>;

}  // namespace quorum::schema
