#include <quorum/common/validation.hpp>
#include <quorum/onchain/approval_automaton.hpp>
#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/query_error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <iterator>
#include <tuple>

using namespace quorum::schema;

namespace {

using encoder_t = quorum::schema::encoding::encoder<
    quorum::schema::encoding::scale_encoder_tag>;

std::string_view log_for(const transaction_error_code code) {
  using enum transaction_error_code;
  switch (code) {
    case invalid_transaction:
      return "invalid call";
    case unsupported_version:
      return "unsupported call version";
    case authorization_denied:
      return "caller is not a custodian";
    case zero_address:
      return "destination is the zero address";
    case zero_amount:
      return "amount must be positive";
    case proposal_missing:
      return "proposal not found";
    case proposal_terminal:
      return "proposal already finalized";
    case duplicate_approval:
      return "custodian already approved";
    case approval_missing:
      return "custodian has not approved";
    case proposal_not_expired:
      return "proposal has not expired";
    case insufficient_balance:
      return "insufficient balance";
    case transfer_failed:
      return "token transfer failed";
    default:
      return "call rejected";
  }
}

transaction_event_attribute_t attribute(std::string key, std::string value) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = true};
}

transaction_result_t make_rejection(const transaction_error_code code,
                                    std::string info) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log_for(code)};
  result.info = std::move(info);
  result.codespace = std::string{quorum::onchain::kCodespace};
  return result;
}

query_result_t make_query_error(query_result_t result,
                                const query_error_code code,
                                std::string log) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  return result;
}

}  // namespace

namespace quorum::onchain {

std::unique_ptr<approval_automaton> approval_automaton::create(
    custodian_roster_t roster,
    const address_t& self,
    quorum::ledger::token_ledger_t ledger,
    automaton_options options,
    std::string& error) {
  if (!quorum::common::validate_roster(roster, error)) {
    spdlog::error("Rejected custodian roster: {}", error);
    return nullptr;
  }
  if (!ledger.balance_of || !ledger.transfer) {
    error = "token ledger capability is incomplete";
    return nullptr;
  }
  return std::make_unique<approval_automaton>(construction_key{},
                                              std::move(roster), self,
                                              std::move(ledger),
                                              std::move(options));
}

approval_automaton::approval_automaton(construction_key,
                                       custodian_roster_t roster,
                                       const address_t& self,
                                       quorum::ledger::token_ledger_t ledger,
                                       automaton_options options)
    : roster_{std::move(roster)},
      self_{self},
      ledger_{std::move(ledger)},
      options_{std::move(options)} {
  spdlog::info("Approval automaton at {} ready: {}-of-{}, expiry {}s",
               to_hex(self_), roster_.threshold, roster_.custodians.size(),
               options_.expiration_period_seconds);
}

transaction_result_t approval_automaton::submit(const address_t& caller,
                                                const address_t& to,
                                                const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto saved = make_checkpoint();

  if (!quorum::common::is_custodian(roster_, caller)) {
    return fail(saved, {transaction_error_code::authorization_denied,
                        to_hex(caller)});
  }
  if (auto invalid = quorum::common::validate_transfer(to, amount)) {
    return fail(saved, {*invalid, to_hex(to)});
  }

  auto id = static_cast<uint64_t>(proposals_.size());
  proposals_.push_back(proposal_state_t{.id = id,
                                        .to = to,
                                        .amount = amount,
                                        .status = proposal_status_t::open,
                                        .approval_count = 1,
                                        .created_at = now()});
  add_approval(id, caller);
  emit(kSubmissionEvent, {attribute("proposal_id", std::to_string(id)),
                          attribute("custodian", to_hex(caller)),
                          attribute("to", to_hex(to)),
                          attribute("amount", amount.str())});
  emit(kApprovalEvent, {attribute("proposal_id", std::to_string(id)),
                        attribute("custodian", to_hex(caller)),
                        attribute("approvals", "1")});

  if (roster_.threshold <= 1) {
    if (auto rejection = execute(id)) {
      return fail(saved, std::move(*rejection));
    }
  }

  spdlog::info("Proposal {} submitted by {}", id, to_hex(caller));
  return succeed(saved, encoder_t{}.encode(id));
}

transaction_result_t approval_automaton::approve(const address_t& caller,
                                                 const uint64_t proposal_id) {
  auto lock = std::scoped_lock{mutex_};
  auto saved = make_checkpoint();

  if (auto rejection = check_open_proposal(caller, proposal_id)) {
    return fail(saved, std::move(*rejection));
  }
  if (approvals_.contains({proposal_id, caller})) {
    return fail(saved, {transaction_error_code::duplicate_approval,
                        to_hex(caller)});
  }

  auto approvals = ++touch_proposal(proposal_id).approval_count;
  add_approval(proposal_id, caller);
  emit(kApprovalEvent, {attribute("proposal_id", std::to_string(proposal_id)),
                        attribute("custodian", to_hex(caller)),
                        attribute("approvals", std::to_string(approvals))});

  if (approvals >= roster_.threshold) {
    if (auto rejection = execute(proposal_id)) {
      return fail(saved, std::move(*rejection));
    }
  }
  return succeed(saved, {});
}

transaction_result_t approval_automaton::revoke(const address_t& caller,
                                                const uint64_t proposal_id) {
  auto lock = std::scoped_lock{mutex_};
  auto saved = make_checkpoint();

  if (auto rejection = check_open_proposal(caller, proposal_id)) {
    return fail(saved, std::move(*rejection));
  }
  if (!approvals_.contains({proposal_id, caller})) {
    return fail(saved,
                {transaction_error_code::approval_missing, to_hex(caller)});
  }

  auto& proposal = touch_proposal(proposal_id);
  --proposal.approval_count;
  remove_approval(proposal_id, caller);
  emit(kRevocationEvent,
       {attribute("proposal_id", std::to_string(proposal_id)),
        attribute("custodian", to_hex(caller)),
        attribute("approvals", std::to_string(proposal.approval_count))});

  // Zero approvals closes the proposal for good.
  if (proposal.approval_count == 0) {
    proposal.status = proposal_status_t::cancelled;
    emit(kCancellationEvent,
         {attribute("proposal_id", std::to_string(proposal_id)),
          attribute("reason", "zero_approvals")});
    spdlog::info("Proposal {} cancelled after last approval was revoked",
                 proposal_id);
  }
  return succeed(saved, {});
}

transaction_result_t approval_automaton::cancel_expired(
    const address_t& caller,
    const uint64_t proposal_id) {
  auto lock = std::scoped_lock{mutex_};
  auto saved = make_checkpoint();

  if (auto rejection = check_open_proposal(caller, proposal_id)) {
    return fail(saved, std::move(*rejection));
  }
  const auto& proposal = proposals_[proposal_id];
  if (!expired_locked(proposal)) {
    return fail(saved, {transaction_error_code::proposal_not_expired,
                        "expires after " +
                            std::to_string(quorum::common::expiry_deadline(
                                proposal.created_at,
                                options_.expiration_period_seconds))});
  }

  touch_proposal(proposal_id).status = proposal_status_t::expired;
  emit(kCancellationEvent,
       {attribute("proposal_id", std::to_string(proposal_id)),
        attribute("custodian", to_hex(caller)),
        attribute("reason", "expired")});
  spdlog::info("Proposal {} cancelled as expired by {}", proposal_id,
               to_hex(caller));
  return succeed(saved, {});
}

transaction_result_t approval_automaton::apply(const bytes_view_t& raw_call) {
  auto encoder = encoder_t{};
  auto call = encoder.try_decode<call_t>(raw_call);
  if (!call) {
    return make_rejection(transaction_error_code::invalid_transaction,
                          "call bytes are not a SCALE call envelope");
  }
  if (call->version != 1) {
    return make_rejection(transaction_error_code::unsupported_version,
                          "expected version 1");
  }

  auto result = transaction_result_t{};
  std::visit(
      overloaded{
          [&](const submit_t& payload) {
            result = payload.version == 1
                         ? submit(call->caller, payload.to, payload.amount)
                         : make_rejection(
                               transaction_error_code::unsupported_version,
                               "submit payload");
          },
          [&](const approve_t& payload) {
            result = payload.version == 1
                         ? approve(call->caller, payload.proposal_id)
                         : make_rejection(
                               transaction_error_code::unsupported_version,
                               "approve payload");
          },
          [&](const revoke_t& payload) {
            result = payload.version == 1
                         ? revoke(call->caller, payload.proposal_id)
                         : make_rejection(
                               transaction_error_code::unsupported_version,
                               "revoke payload");
          },
          [&](const cancel_expired_t& payload) {
            result = payload.version == 1
                         ? cancel_expired(call->caller, payload.proposal_id)
                         : make_rejection(
                               transaction_error_code::unsupported_version,
                               "cancel_expired payload");
          }},
      call->payload);
  return result;
}

query_result_t approval_automaton::query(std::string_view path,
                                         const bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoder_t{};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.codespace = std::string{kCodespace};

  if (path == "/state/roster") {
    result.value = encoder.encode(roster_);
    return result;
  }
  if (path == "/state/count") {
    result.value = encoder.encode(static_cast<uint64_t>(proposals_.size()));
    return result;
  }
  if (path == "/state/balance") {
    result.value = encoder.encode(balance());
    return result;
  }
  if (path == "/state/proposal" || path == "/state/expired") {
    auto id = encoder.try_decode<uint64_t>(data);
    if (!id) {
      return make_query_error(std::move(result), query_error_code::invalid_key,
                              "expected SCALE u64 proposal id");
    }
    if (*id >= proposals_.size()) {
      return make_query_error(std::move(result), query_error_code::not_found,
                              "proposal not found");
    }
    const auto& proposal = proposals_[*id];
    result.value = path == "/state/proposal"
                       ? encoder.encode(proposal)
                       : encoder.encode(*is_expired(*id));
    return result;
  }
  if (path == "/state/approval") {
    auto key = encoder.try_decode<std::tuple<uint64_t, address_t>>(data);
    if (!key) {
      return make_query_error(std::move(result), query_error_code::invalid_key,
                              "expected SCALE (u64, address)");
    }
    auto approved = is_approved(std::get<0>(*key), std::get<1>(*key));
    if (!approved) {
      return make_query_error(std::move(result), query_error_code::not_found,
                              "proposal not found");
    }
    result.value = encoder.encode(*approved);
    return result;
  }
  if (path == "/events/range") {
    auto range = encoder.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return make_query_error(std::move(result), query_error_code::invalid_key,
                              "expected SCALE (u64, u64)");
    }
    result.value =
        encoder.encode(events(std::get<0>(*range), std::get<1>(*range)));
    return result;
  }
  return make_query_error(std::move(result),
                          query_error_code::unsupported_path,
                          "unsupported query path");
}

custodian_roster_t approval_automaton::roster() const {
  return roster_;
}

uint32_t approval_automaton::threshold() const {
  return roster_.threshold;
}

uint64_t approval_automaton::owner_count() const {
  return roster_.custodians.size();
}

bool approval_automaton::is_owner(const address_t& address) const {
  return quorum::common::is_custodian(roster_, address);
}

const address_t& approval_automaton::address() const {
  return self_;
}

uint64_t approval_automaton::expiration_period() const {
  return options_.expiration_period_seconds;
}

std::optional<proposal_state_t> approval_automaton::proposal(
    const uint64_t proposal_id) const {
  auto lock = std::scoped_lock{mutex_};
  if (proposal_id >= proposals_.size()) {
    return std::nullopt;
  }
  return proposals_[proposal_id];
}

std::optional<bool> approval_automaton::is_approved(
    const uint64_t proposal_id,
    const address_t& custodian) const {
  auto lock = std::scoped_lock{mutex_};
  if (proposal_id >= proposals_.size()) {
    return std::nullopt;
  }
  return approvals_.contains({proposal_id, custodian});
}

std::optional<bool> approval_automaton::is_expired(
    const uint64_t proposal_id) const {
  auto lock = std::scoped_lock{mutex_};
  if (proposal_id >= proposals_.size()) {
    return std::nullopt;
  }
  const auto& proposal = proposals_[proposal_id];
  if (proposal.status == proposal_status_t::expired) {
    return true;
  }
  return proposal.status == proposal_status_t::open &&
         expired_locked(proposal);
}

uint64_t approval_automaton::proposal_count() const {
  auto lock = std::scoped_lock{mutex_};
  return proposals_.size();
}

amount_t approval_automaton::balance() const {
  return ledger_.balance_of(self_);
}

std::vector<transaction_event_t> approval_automaton::events(
    const uint64_t from,
    const uint64_t to) const {
  auto lock = std::scoped_lock{mutex_};
  auto end = std::min<uint64_t>(to, events_.size());
  if (from >= end) {
    return {};
  }
  return {std::next(std::begin(events_), static_cast<std::ptrdiff_t>(from)),
          std::next(std::begin(events_), static_cast<std::ptrdiff_t>(end))};
}

uint64_t approval_automaton::event_count() const {
  auto lock = std::scoped_lock{mutex_};
  return events_.size();
}

approval_automaton::checkpoint approval_automaton::make_checkpoint() {
  auto saved = checkpoint{.undo_size = undo_log_.size(),
                          .proposal_count = proposals_.size(),
                          .event_count = events_.size(),
                          .outermost = !in_call_};
  in_call_ = true;
  return saved;
}

void approval_automaton::finish_call(const checkpoint& saved) {
  // A nested call's undo entries stay until the outermost call settles.
  if (saved.outermost) {
    undo_log_.clear();
    in_call_ = false;
  }
}

transaction_result_t approval_automaton::fail(const checkpoint& saved,
                                              rejection_t rejection) {
  while (undo_log_.size() > saved.undo_size) {
    std::visit(overloaded{[&](proposal_changed& entry) {
                            const auto id = entry.previous.id;
                            proposals_[id] = std::move(entry.previous);
                          },
                          [&](const approval_added& entry) {
                            approvals_.erase(entry.key);
                          },
                          [&](approval_removed& entry) {
                            approvals_.insert(std::move(entry.key));
                          }},
               undo_log_.back());
    undo_log_.pop_back();
  }
  proposals_.resize(saved.proposal_count);
  events_.resize(saved.event_count);
  finish_call(saved);
  spdlog::debug("Call rejected ({}): {}", log_for(rejection.first),
                rejection.second);
  return make_rejection(rejection.first, std::move(rejection.second));
}

transaction_result_t approval_automaton::succeed(const checkpoint& saved,
                                                 bytes_t data) {
  auto result = transaction_result_t{};
  result.data = std::move(data);
  result.codespace = std::string{kCodespace};
  result.events.assign(
      std::next(std::begin(events_),
                static_cast<std::ptrdiff_t>(saved.event_count)),
      std::end(events_));
  finish_call(saved);
  return result;
}

proposal_state_t& approval_automaton::touch_proposal(
    const uint64_t proposal_id) {
  auto& proposal = proposals_[proposal_id];
  undo_log_.emplace_back(proposal_changed{.previous = proposal});
  return proposal;
}

void approval_automaton::add_approval(const uint64_t proposal_id,
                                      const address_t& custodian) {
  if (approvals_.emplace(proposal_id, custodian).second) {
    undo_log_.emplace_back(approval_added{.key = {proposal_id, custodian}});
  }
}

void approval_automaton::remove_approval(const uint64_t proposal_id,
                                         const address_t& custodian) {
  if (approvals_.erase({proposal_id, custodian}) != 0) {
    undo_log_.emplace_back(approval_removed{.key = {proposal_id, custodian}});
  }
}

std::optional<approval_automaton::rejection_t>
approval_automaton::check_open_proposal(const address_t& caller,
                                        const uint64_t proposal_id) const {
  if (!quorum::common::is_custodian(roster_, caller)) {
    return rejection_t{transaction_error_code::authorization_denied,
                       to_hex(caller)};
  }
  if (proposal_id >= proposals_.size()) {
    return rejection_t{transaction_error_code::proposal_missing,
                       std::to_string(proposal_id)};
  }
  const auto& proposal = proposals_[proposal_id];
  if (is_terminal(proposal.status)) {
    return rejection_t{transaction_error_code::proposal_terminal,
                       std::string{to_string(proposal.status)}};
  }
  return std::nullopt;
}

std::optional<approval_automaton::rejection_t> approval_automaton::execute(
    const uint64_t proposal_id) {
  const auto to = proposals_[proposal_id].to;
  const auto amount = proposals_[proposal_id].amount;
  const auto self_transfer = to == self_;

  try {
    auto available = ledger_.balance_of(self_);
    if (available < amount) {
      return rejection_t{transaction_error_code::insufficient_balance,
                         "holding " + available.str() + ", need " +
                             amount.str()};
    }

    // Finalize before the external call; a reentrant call sees it as done.
    touch_proposal(proposal_id).status = proposal_status_t::completed;

    auto before = self_transfer ? amount_t{} : ledger_.balance_of(to);
    auto outcome = ledger_.transfer(self_, to, amount);
    if (outcome.aborted) {
      return rejection_t{transaction_error_code::transfer_failed,
                         "token transfer aborted"};
    }
    // The reported flag is not trusted; the recipient's balance is.
    if (!self_transfer) {
      auto after = ledger_.balance_of(to);
      if (after < before || (after - before) < amount) {
        return rejection_t{transaction_error_code::transfer_failed,
                           "recipient credited less than " + amount.str()};
      }
    }
    if (!outcome.reported_success) {
      spdlog::warn(
          "Token ledger reported failure for proposal {} but the transfer "
          "settled",
          proposal_id);
    }
  } catch (const std::exception& ex) {
    return rejection_t{transaction_error_code::transfer_failed, ex.what()};
  }

  emit(kExecutionEvent, {attribute("proposal_id", std::to_string(proposal_id)),
                         attribute("to", to_hex(to)),
                         attribute("amount", amount.str())});
  spdlog::info("Proposal {} executed: {} to {}", proposal_id, amount.str(),
               to_hex(to));
  return std::nullopt;
}

void approval_automaton::emit(
    std::string_view type,
    std::vector<transaction_event_attribute_t> attributes) {
  events_.push_back(transaction_event_t{.type = std::string{type},
                                        .attributes = std::move(attributes)});
}

bool approval_automaton::expired_locked(const proposal_state_t& proposal) const {
  return quorum::common::is_expired(
      quorum::common::expiry_deadline(proposal.created_at,
                                      options_.expiration_period_seconds),
      now());
}

timestamp_seconds_t approval_automaton::now() const {
  if (options_.clock) {
    return options_.clock();
  }
  return static_cast<timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace quorum::onchain
