#pragma once

#include <quorum/ledger/token_ledger.hpp>
#include <quorum/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <map>

namespace quorum::ledger {

enum class transfer_mode : uint8_t {
  // Moves funds and reports success.
  honest = 0,
  // Moves funds but reports failure, like the legacy stablecoin contract.
  reports_failure = 1,
  // The call reverts; nothing moves.
  aborts = 2,
  // Credits the recipient one unit less than requested.
  short_pays = 3,
};

/// In-process token ledger. Balances live in a map; the transfer behaviour
/// and a hook run after funds move are configurable.
class memory_token_ledger final {
 public:
  using transfer_hook_t =
      std::function<void(const quorum::schema::address_t& from,
                         const quorum::schema::address_t& to,
                         const quorum::schema::amount_t& amount)>;

  void mint(const quorum::schema::address_t& account,
            const quorum::schema::amount_t& amount);

  quorum::schema::amount_t balance_of(
      const quorum::schema::address_t& account) const;

  transfer_outcome transfer(const quorum::schema::address_t& from,
                            const quorum::schema::address_t& to,
                            const quorum::schema::amount_t& amount);

  void set_mode(transfer_mode mode);
  void set_transfer_hook(transfer_hook_t hook);

  uint64_t transfer_count() const;

  /// Capability bound to this ledger; the ledger must outlive it.
  token_ledger_t capability();

 private:
  std::map<quorum::schema::address_t, quorum::schema::amount_t> balances_;
  transfer_mode mode_{transfer_mode::honest};
  transfer_hook_t hook_;
  uint64_t transfer_count_{};
};

}  // namespace quorum::ledger
