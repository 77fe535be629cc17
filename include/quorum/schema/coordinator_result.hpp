#pragma once

#include <quorum/schema/pending_transaction.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: coordinator result.
// Outcome of one coordinator operation; `record` carries the affected pending
// transaction as stored after the call.
namespace quorum::schema {

template <uint16_t Version>
struct coordinator_result;

template <>
struct coordinator_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<pending_transaction_t> record;
};

using coordinator_result_t = coordinator_result<1>;

}  // namespace quorum::schema
