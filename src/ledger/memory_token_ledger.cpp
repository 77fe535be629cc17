#include <quorum/ledger/memory_token_ledger.hpp>

#include <spdlog/spdlog.h>

namespace quorum::ledger {

void memory_token_ledger::mint(const quorum::schema::address_t& account,
                               const quorum::schema::amount_t& amount) {
  balances_[account] += amount;
}

quorum::schema::amount_t memory_token_ledger::balance_of(
    const quorum::schema::address_t& account) const {
  auto found = balances_.find(account);
  if (found == std::end(balances_)) {
    return 0;
  }
  return found->second;
}

transfer_outcome memory_token_ledger::transfer(
    const quorum::schema::address_t& from,
    const quorum::schema::address_t& to,
    const quorum::schema::amount_t& amount) {
  if (mode_ == transfer_mode::aborts) {
    return transfer_outcome{.aborted = true, .reported_success = false};
  }
  if (balance_of(from) < amount) {
    return transfer_outcome{.aborted = false, .reported_success = false};
  }

  auto credited = amount;
  if (mode_ == transfer_mode::short_pays && credited > 0) {
    credited -= 1;
  }
  balances_[from] -= amount;
  balances_[to] += credited;
  ++transfer_count_;
  spdlog::debug("token ledger moved {} (credited {})", amount.str(),
                credited.str());

  if (hook_) {
    hook_(from, to, amount);
  }
  return transfer_outcome{
      .aborted = false,
      .reported_success = mode_ != transfer_mode::reports_failure};
}

void memory_token_ledger::set_mode(const transfer_mode mode) {
  mode_ = mode;
}

void memory_token_ledger::set_transfer_hook(transfer_hook_t hook) {
  hook_ = std::move(hook);
}

uint64_t memory_token_ledger::transfer_count() const {
  return transfer_count_;
}

token_ledger_t memory_token_ledger::capability() {
  return token_ledger_t{
      .balance_of =
          [this](const quorum::schema::address_t& account) {
            return balance_of(account);
          },
      .transfer = [this](const quorum::schema::address_t& from,
                         const quorum::schema::address_t& to,
                         const quorum::schema::amount_t& amount) {
        return transfer(from, to, amount);
      }};
}

}  // namespace quorum::ledger
