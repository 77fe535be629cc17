#pragma once

#include <quorum/schema/custodian_roster.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/transaction_error_code.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Address, amount, roster and expiry checks shared by the on-chain automaton
// and the off-chain coordinator.
namespace quorum::common {

bool is_zero_address(const quorum::schema::address_t& address);

bool is_positive_amount(const quorum::schema::amount_t& amount);

/// First failing check for a transfer request, or std::nullopt when valid.
std::optional<quorum::schema::transaction_error_code> validate_transfer(
    const quorum::schema::address_t& to,
    const quorum::schema::amount_t& amount);

/// Roster must be non-empty, free of zero and duplicate addresses, and carry
/// 1 <= threshold <= size. On failure `error` holds the reason.
bool validate_roster(const quorum::schema::custodian_roster_t& roster,
                     std::string& error);

bool is_custodian(const quorum::schema::custodian_roster_t& roster,
                  const quorum::schema::address_t& address);

/// `start + period`, clamped to the maximum representable value.
uint64_t expiry_deadline(uint64_t start, uint64_t period);

/// Expired strictly after the deadline; the deadline instant itself is live.
bool is_expired(uint64_t deadline, uint64_t now);

}  // namespace quorum::common
