#pragma once

#include <cstdint>

// Read-path failures of approval_automaton::query, reported in
// query_result_t::code.
namespace quorum::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

}  // namespace quorum::schema
