#include <quorum/onchain/approval_automaton.hpp>
#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/query_error_code.hpp>
#include <quorum/testing/automaton_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace {

using quorum::schema::proposal_status_t;
using quorum::schema::transaction_error_code;
using quorum::testing::automaton_fixture;
using quorum::testing::event_types;
using encoder_t = quorum::schema::encoding::encoder<
    quorum::schema::encoding::scale_encoder_tag>;

constexpr auto kOk = uint32_t{0};

uint32_t code_of(const transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

std::vector<std::string> types(
    std::initializer_list<std::string_view> names) {
  auto out = std::vector<std::string>{};
  for (auto name : names) {
    out.emplace_back(name);
  }
  return out;
}

}  // namespace

TEST(approval_automaton, two_of_three_executes_on_second_approval) {
  auto fixture = automaton_fixture{3, 2, 1000};
  auto& automaton = fixture.automaton();

  auto submitted = automaton.submit(automaton_fixture::custodian(1),
                                    automaton_fixture::recipient(), 100);
  ASSERT_EQ(submitted.code, kOk) << submitted.log;
  EXPECT_EQ(encoder_t{}.decode<uint64_t>(submitted.data), 0u);
  EXPECT_EQ(event_types(submitted.events),
            types({quorum::schema::kSubmissionEvent,
                   quorum::schema::kApprovalEvent}));

  auto proposal = automaton.proposal(0);
  ASSERT_TRUE(proposal.has_value());
  EXPECT_EQ(proposal->status, proposal_status_t::open);
  EXPECT_EQ(proposal->approval_count, 1u);
  EXPECT_EQ(automaton.is_approved(0, automaton_fixture::custodian(1)), true);

  auto approved = automaton.approve(automaton_fixture::custodian(2), 0);
  ASSERT_EQ(approved.code, kOk) << approved.log;
  EXPECT_EQ(event_types(approved.events),
            types({quorum::schema::kApprovalEvent,
                   quorum::schema::kExecutionEvent}));

  proposal = automaton.proposal(0);
  EXPECT_EQ(proposal->status, proposal_status_t::completed);
  EXPECT_TRUE(quorum::schema::is_executed(*proposal));
  EXPECT_EQ(proposal->approval_count, 2u);
  EXPECT_EQ(fixture.ledger().balance_of(automaton_fixture::recipient()), 100);
  EXPECT_EQ(automaton.balance(), 900);

  auto late = automaton.approve(automaton_fixture::custodian(3), 0);
  EXPECT_EQ(late.code, code_of(transaction_error_code::proposal_terminal));
  EXPECT_EQ(automaton.event_count(), 4u);
}

TEST(approval_automaton, one_of_two_executes_on_submit) {
  auto fixture = automaton_fixture{2, 1, 50};
  auto& automaton = fixture.automaton();
  auto submitted = automaton.submit(automaton_fixture::custodian(2),
                                    automaton_fixture::recipient(), 50);
  ASSERT_EQ(submitted.code, kOk) << submitted.log;
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::completed);
  EXPECT_EQ(automaton.balance(), 0);
  EXPECT_EQ(event_types(submitted.events),
            types({quorum::schema::kSubmissionEvent,
                   quorum::schema::kApprovalEvent,
                   quorum::schema::kExecutionEvent}));
}

TEST(approval_automaton, rejects_invalid_roster) {
  auto ledger = quorum::ledger::memory_token_ledger{};
  auto error = std::string{};
  auto roster = quorum::schema::custodian_roster_t{
      .custodians = {quorum::testing::make_address(1)}, .threshold = 2};
  auto automaton = quorum::onchain::approval_automaton::create(
      roster, quorum::testing::make_address(9), ledger.capability(), {}, error);
  EXPECT_TRUE(automaton == nullptr);
  EXPECT_FALSE(error.empty());
}

TEST(approval_automaton, submit_validation) {
  auto fixture = automaton_fixture{3, 2, 1000};
  auto& automaton = fixture.automaton();

  auto outsider = automaton.submit(quorum::testing::make_address(0x77),
                                   automaton_fixture::recipient(), 10);
  EXPECT_EQ(outsider.code,
            code_of(transaction_error_code::authorization_denied));
  auto zero_to = automaton.submit(automaton_fixture::custodian(1),
                                  quorum::schema::make_zero_address(), 10);
  EXPECT_EQ(zero_to.code, code_of(transaction_error_code::zero_address));
  auto zero_amount = automaton.submit(automaton_fixture::custodian(1),
                                      automaton_fixture::recipient(), 0);
  EXPECT_EQ(zero_amount.code, code_of(transaction_error_code::zero_amount));

  EXPECT_EQ(automaton.proposal_count(), 0u);
  EXPECT_EQ(automaton.event_count(), 0u);
  EXPECT_EQ(outsider.codespace, quorum::onchain::kCodespace);
}

TEST(approval_automaton, guard_order_is_authorization_then_existence) {
  auto fixture = automaton_fixture{3, 2, 1000};
  auto& automaton = fixture.automaton();

  auto outsider = automaton.approve(quorum::testing::make_address(0x77), 42);
  EXPECT_EQ(outsider.code,
            code_of(transaction_error_code::authorization_denied));
  auto missing = automaton.approve(automaton_fixture::custodian(1), 42);
  EXPECT_EQ(missing.code, code_of(transaction_error_code::proposal_missing));

  automaton.submit(automaton_fixture::custodian(1),
                   automaton_fixture::recipient(), 10);
  auto duplicate = automaton.approve(automaton_fixture::custodian(1), 0);
  EXPECT_EQ(duplicate.code,
            code_of(transaction_error_code::duplicate_approval));
  EXPECT_EQ(automaton.proposal(0)->approval_count, 1u);
}

TEST(approval_automaton, insufficient_balance_rolls_back_approval) {
  auto fixture = automaton_fixture{3, 2, 10};
  auto& automaton = fixture.automaton();
  automaton.submit(automaton_fixture::custodian(1),
                   automaton_fixture::recipient(), 100);
  auto events_before = automaton.event_count();

  auto approved = automaton.approve(automaton_fixture::custodian(2), 0);
  EXPECT_EQ(approved.code,
            code_of(transaction_error_code::insufficient_balance));
  EXPECT_TRUE(approved.events.empty());
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::open);
  EXPECT_EQ(automaton.proposal(0)->approval_count, 1u);
  EXPECT_EQ(automaton.is_approved(0, automaton_fixture::custodian(2)), false);
  EXPECT_EQ(automaton.event_count(), events_before);

  fixture.ledger().mint(automaton_fixture::self(), 90);
  auto retried = automaton.approve(automaton_fixture::custodian(2), 0);
  ASSERT_EQ(retried.code, kOk) << retried.log;
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::completed);
  EXPECT_EQ(automaton.balance(), 0);
}

TEST(approval_automaton, false_failure_report_still_executes) {
  auto fixture = automaton_fixture{2, 2, 100};
  auto& automaton = fixture.automaton();
  fixture.ledger().set_mode(quorum::ledger::transfer_mode::reports_failure);
  automaton.submit(automaton_fixture::custodian(1),
                   automaton_fixture::recipient(), 60);
  auto approved = automaton.approve(automaton_fixture::custodian(2), 0);
  ASSERT_EQ(approved.code, kOk) << approved.log;
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::completed);
  EXPECT_EQ(fixture.ledger().balance_of(automaton_fixture::recipient()), 60);
}

TEST(approval_automaton, short_credit_fails_the_call) {
  auto fixture = automaton_fixture{2, 2, 100};
  auto& automaton = fixture.automaton();
  fixture.ledger().set_mode(quorum::ledger::transfer_mode::short_pays);
  automaton.submit(automaton_fixture::custodian(1),
                   automaton_fixture::recipient(), 60);
  auto approved = automaton.approve(automaton_fixture::custodian(2), 0);
  EXPECT_EQ(approved.code, code_of(transaction_error_code::transfer_failed));
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::open);
  EXPECT_EQ(automaton.is_approved(0, automaton_fixture::custodian(2)), false);
}

TEST(approval_automaton, aborted_transfer_fails_the_call) {
  auto fixture = automaton_fixture{2, 2, 100};
  auto& automaton = fixture.automaton();
  fixture.ledger().set_mode(quorum::ledger::transfer_mode::aborts);
  automaton.submit(automaton_fixture::custodian(1),
                   automaton_fixture::recipient(), 60);
  auto approved = automaton.approve(automaton_fixture::custodian(2), 0);
  EXPECT_EQ(approved.code, code_of(transaction_error_code::transfer_failed));
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::open);
  EXPECT_EQ(automaton.balance(), 100);
}

TEST(approval_automaton, transfer_to_self_executes) {
  auto fixture = automaton_fixture{2, 1, 100};
  auto& automaton = fixture.automaton();
  auto submitted = automaton.submit(automaton_fixture::custodian(1),
                                    automaton_fixture::self(), 40);
  ASSERT_EQ(submitted.code, kOk) << submitted.log;
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::completed);
  EXPECT_EQ(automaton.balance(), 100);
}

TEST(approval_automaton, revoking_last_approval_cancels) {
  auto fixture = automaton_fixture{3, 3, 100};
  auto& automaton = fixture.automaton();
  automaton.submit(automaton_fixture::custodian(1),
                   automaton_fixture::recipient(), 10);
  automaton.approve(automaton_fixture::custodian(2), 0);

  auto missing = automaton.revoke(automaton_fixture::custodian(3), 0);
  EXPECT_EQ(missing.code, code_of(transaction_error_code::approval_missing));

  auto first = automaton.revoke(automaton_fixture::custodian(2), 0);
  ASSERT_EQ(first.code, kOk);
  EXPECT_EQ(automaton.proposal(0)->approval_count, 1u);
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::open);

  auto last = automaton.revoke(automaton_fixture::custodian(1), 0);
  ASSERT_EQ(last.code, kOk);
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::cancelled);
  ASSERT_EQ(last.events.size(), 2u);
  EXPECT_EQ(last.events[1].type, quorum::schema::kCancellationEvent);
  EXPECT_EQ(quorum::schema::find_attribute(last.events[1], "reason"),
            "zero_approvals");

  auto approve = automaton.approve(automaton_fixture::custodian(2), 0);
  EXPECT_EQ(approve.code, code_of(transaction_error_code::proposal_terminal));
  EXPECT_EQ(automaton.is_expired(0), false);
}

TEST(approval_automaton, cancel_expired_after_deadline) {
  auto fixture = automaton_fixture{3, 3, 100, 3600};
  auto& automaton = fixture.automaton();
  automaton.submit(automaton_fixture::custodian(1),
                   automaton_fixture::recipient(), 10);

  fixture.advance(3600);
  EXPECT_EQ(automaton.is_expired(0), false);
  auto early = automaton.cancel_expired(automaton_fixture::custodian(2), 0);
  EXPECT_EQ(early.code,
            code_of(transaction_error_code::proposal_not_expired));

  fixture.advance(1);
  EXPECT_EQ(automaton.is_expired(0), true);
  auto cancelled = automaton.cancel_expired(automaton_fixture::custodian(2), 0);
  ASSERT_EQ(cancelled.code, kOk) << cancelled.log;
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::expired);
  ASSERT_EQ(cancelled.events.size(), 1u);
  EXPECT_EQ(quorum::schema::find_attribute(cancelled.events[0], "reason"),
            "expired");

  auto again = automaton.cancel_expired(automaton_fixture::custodian(2), 0);
  EXPECT_EQ(again.code, code_of(transaction_error_code::proposal_terminal));
  EXPECT_EQ(automaton.is_expired(0), true);
}

TEST(approval_automaton, approval_after_deadline_still_executes) {
  auto fixture = automaton_fixture{2, 2, 100, 60};
  auto& automaton = fixture.automaton();
  automaton.submit(automaton_fixture::custodian(1),
                   automaton_fixture::recipient(), 10);
  fixture.advance(120);
  EXPECT_EQ(automaton.is_expired(0), true);
  auto approved = automaton.approve(automaton_fixture::custodian(2), 0);
  ASSERT_EQ(approved.code, kOk) << approved.log;
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::completed);
  EXPECT_EQ(automaton.is_expired(0), false);
}

TEST(approval_automaton, reentrant_approval_sees_finalized_proposal) {
  auto fixture = automaton_fixture{3, 2, 100};
  auto& automaton = fixture.automaton();
  automaton.submit(automaton_fixture::custodian(1),
                   automaton_fixture::recipient(), 10);

  auto nested = std::optional<quorum::schema::transaction_result_t>{};
  fixture.ledger().set_transfer_hook(
      [&](const auto&, const auto&, const auto&) {
        nested = automaton.approve(automaton_fixture::custodian(3), 0);
      });

  auto approved = automaton.approve(automaton_fixture::custodian(2), 0);
  ASSERT_EQ(approved.code, kOk) << approved.log;
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(nested->code, code_of(transaction_error_code::proposal_terminal));
  EXPECT_EQ(fixture.ledger().transfer_count(), 1u);
  EXPECT_EQ(automaton.is_approved(0, automaton_fixture::custodian(3)), false);
}

TEST(approval_automaton, failed_call_undoes_nested_calls) {
  auto fixture = automaton_fixture{3, 2, 100};
  auto& automaton = fixture.automaton();
  automaton.submit(automaton_fixture::custodian(1),
                   automaton_fixture::recipient(), 10);
  automaton.submit(automaton_fixture::custodian(2),
                   automaton_fixture::recipient(), 20);
  auto events_before = automaton.event_count();

  auto nested_revoke = uint32_t{1};
  auto nested_submit = uint32_t{1};
  fixture.ledger().set_mode(quorum::ledger::transfer_mode::short_pays);
  fixture.ledger().set_transfer_hook(
      [&](const auto&, const auto&, const auto&) {
        nested_revoke =
            automaton.revoke(automaton_fixture::custodian(2), 1).code;
        nested_submit = automaton
                            .submit(automaton_fixture::custodian(3),
                                    automaton_fixture::recipient(), 5)
                            .code;
      });

  auto approved = automaton.approve(automaton_fixture::custodian(2), 0);
  EXPECT_EQ(approved.code, code_of(transaction_error_code::transfer_failed));
  EXPECT_EQ(nested_revoke, kOk);
  EXPECT_EQ(nested_submit, kOk);

  EXPECT_EQ(automaton.proposal_count(), 2u);
  EXPECT_EQ(automaton.event_count(), events_before);
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::open);
  EXPECT_EQ(automaton.proposal(0)->approval_count, 1u);
  EXPECT_EQ(automaton.is_approved(0, automaton_fixture::custodian(2)), false);
  EXPECT_EQ(automaton.proposal(1)->status, proposal_status_t::open);
  EXPECT_EQ(automaton.proposal(1)->approval_count, 1u);
  EXPECT_EQ(automaton.is_approved(1, automaton_fixture::custodian(2)), true);

  fixture.ledger().set_transfer_hook({});
  fixture.ledger().set_mode(quorum::ledger::transfer_mode::honest);
  auto retried = automaton.approve(automaton_fixture::custodian(3), 1);
  ASSERT_EQ(retried.code, kOk) << retried.log;
  EXPECT_EQ(automaton.proposal(1)->status, proposal_status_t::completed);
}

TEST(approval_automaton, apply_decodes_call_envelope) {
  auto fixture = automaton_fixture{2, 2, 100};
  auto& automaton = fixture.automaton();
  auto encoder = encoder_t{};

  auto submit = quorum::schema::call_t{
      .caller = automaton_fixture::custodian(1),
      .payload = quorum::schema::submit_t{
          .to = automaton_fixture::recipient(), .amount = 25}};
  auto submitted = automaton.apply(encoder.encode(submit));
  ASSERT_EQ(submitted.code, kOk) << submitted.log;

  auto approve = quorum::schema::call_t{
      .caller = automaton_fixture::custodian(2),
      .payload = quorum::schema::approve_t{.proposal_id = 0}};
  auto approved = automaton.apply(encoder.encode(approve));
  ASSERT_EQ(approved.code, kOk) << approved.log;
  EXPECT_EQ(automaton.proposal(0)->status, proposal_status_t::completed);

  auto garbage = quorum::schema::bytes_t{0x01, 0x02};
  EXPECT_EQ(automaton.apply(garbage).code,
            code_of(transaction_error_code::invalid_transaction));

  approve.version = 2;
  EXPECT_EQ(automaton.apply(encoder.encode(approve)).code,
            code_of(transaction_error_code::unsupported_version));
}

TEST(approval_automaton, query_routes) {
  auto fixture = automaton_fixture{3, 2, 100};
  auto& automaton = fixture.automaton();
  auto encoder = encoder_t{};
  automaton.submit(automaton_fixture::custodian(1),
                   automaton_fixture::recipient(), 10);

  auto count = automaton.query("/state/count", {});
  ASSERT_EQ(count.code, kOk);
  EXPECT_EQ(encoder.decode<uint64_t>(count.value), 1u);

  auto roster = automaton.query("/state/roster", {});
  ASSERT_EQ(roster.code, kOk);
  EXPECT_EQ(encoder.decode<quorum::schema::custodian_roster_t>(roster.value)
                .threshold,
            2u);

  auto proposal = automaton.query("/state/proposal", encoder.encode(uint64_t{0}));
  ASSERT_EQ(proposal.code, kOk);
  EXPECT_EQ(encoder.decode<quorum::schema::proposal_state_t>(proposal.value)
                .amount,
            10);

  auto approval = automaton.query(
      "/state/approval",
      encoder.encode(std::tuple{uint64_t{0}, automaton_fixture::custodian(1)}));
  ASSERT_EQ(approval.code, kOk);
  EXPECT_TRUE(encoder.decode<bool>(approval.value));

  auto events = automaton.query(
      "/events/range", encoder.encode(std::tuple{uint64_t{0}, uint64_t{10}}));
  ASSERT_EQ(events.code, kOk);
  EXPECT_EQ(encoder
                .decode<std::vector<quorum::schema::transaction_event_t>>(
                    events.value)
                .size(),
            2u);

  auto missing = automaton.query("/state/proposal", encoder.encode(uint64_t{5}));
  EXPECT_EQ(missing.code,
            static_cast<uint32_t>(quorum::schema::query_error_code::not_found));
  auto bad_key = automaton.query("/state/proposal", quorum::schema::bytes_t{1});
  EXPECT_EQ(bad_key.code, static_cast<uint32_t>(
                              quorum::schema::query_error_code::invalid_key));
  auto unknown = automaton.query("/state/nothing", {});
  EXPECT_EQ(unknown.code,
            static_cast<uint32_t>(
                quorum::schema::query_error_code::unsupported_path));
}

TEST(approval_automaton, events_range_is_half_open) {
  auto fixture = automaton_fixture{3, 2, 100};
  auto& automaton = fixture.automaton();
  automaton.submit(automaton_fixture::custodian(1),
                   automaton_fixture::recipient(), 10);
  automaton.approve(automaton_fixture::custodian(2), 0);
  EXPECT_EQ(automaton.events(1, 3).size(), 2u);
  EXPECT_EQ(automaton.events(3, 100).size(), 1u);
  EXPECT_TRUE(automaton.events(4, 2).empty());
}
