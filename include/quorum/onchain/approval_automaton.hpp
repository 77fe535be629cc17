#pragma once

#include <quorum/ledger/token_ledger.hpp>
#include <quorum/schema/call.hpp>
#include <quorum/schema/custodian_roster.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/proposal_state.hpp>
#include <quorum/schema/query_result.hpp>
#include <quorum/schema/transaction_error_code.hpp>
#include <quorum/schema/transaction_event.hpp>
#include <quorum/schema/transaction_result.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace quorum::onchain {

inline constexpr uint64_t kDefaultExpirationPeriodSeconds = 86'400;
inline constexpr std::string_view kCodespace{"quorum.onchain"};

using block_clock_t = std::function<quorum::schema::timestamp_seconds_t()>;

struct automaton_options final {
  uint64_t expiration_period_seconds{kDefaultExpirationPeriodSeconds};
  /// Block time source. Defaults to the system clock when empty.
  block_clock_t clock;
};

/// M-of-N transfer approval state machine hosted on a serial-execution ledger.
///
/// Custodians submit transfer proposals, approve and revoke them; the transfer
/// executes inside the call that brings the approval count to the threshold.
/// Every mutating call is all-or-nothing: on failure the proposals, approvals
/// and event log are restored to their state before the call.
///
/// The token ledger may call back into the automaton from inside a transfer.
/// Such nested calls run on the same thread and see the proposal already
/// finalized.
class approval_automaton final {
  struct construction_key final {
    explicit construction_key() = default;
  };

 public:
  /// Build an automaton for `roster`, holding funds at `self` on `ledger`.
  ///
  /// Returns nullptr when the roster is invalid (empty, duplicate or zero
  /// custodian, threshold outside 1..size); `error` then holds the reason.
  static std::unique_ptr<approval_automaton> create(
      quorum::schema::custodian_roster_t roster,
      const quorum::schema::address_t& self,
      quorum::ledger::token_ledger_t ledger,
      automaton_options options,
      std::string& error);

  /// Use create().
  approval_automaton(construction_key,
                     quorum::schema::custodian_roster_t roster,
                     const quorum::schema::address_t& self,
                     quorum::ledger::token_ledger_t ledger,
                     automaton_options options);

  approval_automaton(const approval_automaton&) = delete;
  approval_automaton& operator=(const approval_automaton&) = delete;
  approval_automaton(approval_automaton&&) = delete;
  approval_automaton& operator=(approval_automaton&&) = delete;

  /// Propose a transfer; the caller's approval is recorded with it. On
  /// success `data` is the SCALE-encoded proposal id.
  quorum::schema::transaction_result_t submit(
      const quorum::schema::address_t& caller,
      const quorum::schema::address_t& to,
      const quorum::schema::amount_t& amount);

  quorum::schema::transaction_result_t approve(
      const quorum::schema::address_t& caller,
      uint64_t proposal_id);

  quorum::schema::transaction_result_t revoke(
      const quorum::schema::address_t& caller,
      uint64_t proposal_id);

  quorum::schema::transaction_result_t cancel_expired(
      const quorum::schema::address_t& caller,
      uint64_t proposal_id);

  /// Decode a SCALE call envelope and dispatch it.
  quorum::schema::transaction_result_t apply(
      const quorum::schema::bytes_view_t& raw_call);

  /// Execute a read-path query by route.
  quorum::schema::query_result_t query(
      std::string_view path,
      const quorum::schema::bytes_view_t& data) const;

  quorum::schema::custodian_roster_t roster() const;
  uint32_t threshold() const;
  uint64_t owner_count() const;
  bool is_owner(const quorum::schema::address_t& address) const;
  const quorum::schema::address_t& address() const;
  uint64_t expiration_period() const;

  std::optional<quorum::schema::proposal_state_t> proposal(
      uint64_t proposal_id) const;
  /// std::nullopt for an unknown proposal.
  std::optional<bool> is_approved(uint64_t proposal_id,
                                  const quorum::schema::address_t& custodian)
      const;
  std::optional<bool> is_expired(uint64_t proposal_id) const;
  uint64_t proposal_count() const;
  quorum::schema::amount_t balance() const;

  /// Events in the half-open log range [from, to).
  std::vector<quorum::schema::transaction_event_t> events(uint64_t from,
                                                          uint64_t to) const;
  uint64_t event_count() const;

 private:
  using rejection_t =
      std::pair<quorum::schema::transaction_error_code, std::string>;

  using approval_key_t = std::pair<uint64_t, quorum::schema::address_t>;

  // Undo records for state that existed before the entry was written.
  // Proposals appended during a call are dropped by truncation instead.
  struct proposal_changed final {
    quorum::schema::proposal_state_t previous;
  };
  struct approval_added final {
    approval_key_t key;
  };
  struct approval_removed final {
    approval_key_t key;
  };
  using undo_entry_t =
      std::variant<proposal_changed, approval_added, approval_removed>;

  struct checkpoint final {
    std::size_t undo_size{};
    std::size_t proposal_count{};
    std::size_t event_count{};
    /// False for calls re-entered from inside a token transfer.
    bool outermost{};
  };

  checkpoint make_checkpoint();
  quorum::schema::transaction_result_t fail(const checkpoint& saved,
                                            rejection_t rejection);
  quorum::schema::transaction_result_t succeed(
      const checkpoint& saved,
      quorum::schema::bytes_t data);

  /// Shared guard for approve/revoke/cancel_expired: roster membership,
  /// existence and openness, in that order.
  std::optional<rejection_t> check_open_proposal(
      const quorum::schema::address_t& caller,
      uint64_t proposal_id) const;

  /// Transfer the proposal's funds. The proposal is marked completed before
  /// the external call.
  std::optional<rejection_t> execute(uint64_t proposal_id);

  /// Mutable proposal; its prior state goes to the undo log.
  quorum::schema::proposal_state_t& touch_proposal(uint64_t proposal_id);
  void add_approval(uint64_t proposal_id,
                    const quorum::schema::address_t& custodian);
  void remove_approval(uint64_t proposal_id,
                       const quorum::schema::address_t& custodian);
  void finish_call(const checkpoint& saved);

  void emit(std::string_view type,
            std::vector<quorum::schema::transaction_event_attribute_t>
                attributes);

  bool expired_locked(const quorum::schema::proposal_state_t& proposal) const;
  quorum::schema::timestamp_seconds_t now() const;

  mutable std::recursive_mutex mutex_;
  const quorum::schema::custodian_roster_t roster_;
  const quorum::schema::address_t self_;
  quorum::ledger::token_ledger_t ledger_;
  automaton_options options_;
  std::vector<quorum::schema::proposal_state_t> proposals_;
  std::set<approval_key_t> approvals_;
  std::vector<quorum::schema::transaction_event_t> events_;
  std::vector<undo_entry_t> undo_log_;
  bool in_call_{};
};

}  // namespace quorum::onchain
