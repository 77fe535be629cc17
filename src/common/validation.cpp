#include <quorum/common/validation.hpp>

#include <algorithm>
#include <limits>
#include <set>

namespace quorum::common {

bool is_zero_address(const quorum::schema::address_t& address) {
  return std::ranges::all_of(address, [](const uint8_t b) { return b == 0; });
}

bool is_positive_amount(const quorum::schema::amount_t& amount) {
  return amount > 0;
}

std::optional<quorum::schema::transaction_error_code> validate_transfer(
    const quorum::schema::address_t& to,
    const quorum::schema::amount_t& amount) {
  using enum quorum::schema::transaction_error_code;
  if (is_zero_address(to)) {
    return zero_address;
  }
  if (!is_positive_amount(amount)) {
    return zero_amount;
  }
  return std::nullopt;
}

bool validate_roster(const quorum::schema::custodian_roster_t& roster,
                     std::string& error) {
  if (roster.custodians.empty()) {
    error = "roster must name at least one custodian";
    return false;
  }
  auto seen = std::set<quorum::schema::address_t>{};
  for (const auto& custodian : roster.custodians) {
    if (is_zero_address(custodian)) {
      error = "roster contains the zero address";
      return false;
    }
    if (!seen.insert(custodian).second) {
      error = "roster contains a duplicate custodian " +
              quorum::schema::to_hex(custodian);
      return false;
    }
  }
  if (roster.threshold == 0) {
    error = "threshold must be at least 1";
    return false;
  }
  if (roster.threshold > roster.custodians.size()) {
    error = "threshold " + std::to_string(roster.threshold) +
            " exceeds roster size " + std::to_string(roster.custodians.size());
    return false;
  }
  return true;
}

bool is_custodian(const quorum::schema::custodian_roster_t& roster,
                  const quorum::schema::address_t& address) {
  return std::ranges::find(roster.custodians, address) !=
         std::end(roster.custodians);
}

uint64_t expiry_deadline(const uint64_t start, const uint64_t period) {
  if (period > std::numeric_limits<uint64_t>::max() - start) {
    return std::numeric_limits<uint64_t>::max();
  }
  return start + period;
}

bool is_expired(const uint64_t deadline, const uint64_t now) {
  return now > deadline;
}

}  // namespace quorum::common
