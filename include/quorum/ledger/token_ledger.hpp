#pragma once

#include <quorum/schema/primitives.hpp>

#include <functional>

namespace quorum::ledger {

/// What the token contract's transfer call returned. `reported_success` is
/// advisory: the legacy contract may report false after moving the funds.
struct transfer_outcome final {
  bool aborted{};
  bool reported_success{};
};

/// Capability over the external fungible-token ledger.
struct token_ledger_t final {
  std::function<quorum::schema::amount_t(const quorum::schema::address_t&)>
      balance_of;
  std::function<transfer_outcome(const quorum::schema::address_t& from,
                                 const quorum::schema::address_t& to,
                                 const quorum::schema::amount_t& amount)>
      transfer;
};

}  // namespace quorum::ledger
