#pragma once

#include <cstdint>
#include <string_view>

namespace quorum::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_version = 2,
  authorization_denied = 3,
  zero_address = 4,
  zero_amount = 5,
  proposal_missing = 10,
  proposal_terminal = 11,
  duplicate_approval = 12,
  approval_missing = 13,
  proposal_not_expired = 14,
  insufficient_balance = 15,
  transfer_failed = 16,
  pending_missing = 20,
  already_signed = 21,
  invalid_import = 22,
  insufficient_signatures = 23,
  pending_expired = 24,
  pending_terminal = 25,
  broadcast_rejected = 26,
  account_missing = 27,
  transport_failed = 28,
  signing_failed = 29,
};

enum class error_category : uint8_t {
  none = 0,
  authorization = 1,
  not_found = 2,
  invalid_state = 3,
  validation = 4,
  resource = 5,
  transport = 6,
};

constexpr error_category error_category_of(const uint32_t code) {
  using enum transaction_error_code;
  if (code == 0) {
    return error_category::none;
  }
  switch (static_cast<transaction_error_code>(code)) {
    case authorization_denied:
      return error_category::authorization;
    case proposal_missing:
    case pending_missing:
    case account_missing:
      return error_category::not_found;
    case proposal_terminal:
    case duplicate_approval:
    case approval_missing:
    case proposal_not_expired:
    case already_signed:
    case insufficient_signatures:
    case pending_expired:
    case pending_terminal:
      return error_category::invalid_state;
    case invalid_transaction:
    case unsupported_version:
    case zero_address:
    case zero_amount:
    case invalid_import:
      return error_category::validation;
    case insufficient_balance:
    case transfer_failed:
    case signing_failed:
      return error_category::resource;
    case broadcast_rejected:
    case transport_failed:
      return error_category::transport;
  }
  return error_category::validation;
}

constexpr error_category error_category_of(const transaction_error_code code) {
  return error_category_of(static_cast<uint32_t>(code));
}

}  // namespace quorum::schema
