#pragma once

#include <quorum/schema/primitives.hpp>
#include <quorum/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace quorum::schema {

template <uint16_t Version>
struct transaction_result;

/// Outcome of one automaton call. `code` 0 is success, anything else is a
/// transaction_error_code and implies no state change.
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace quorum::schema
