#include <boost/program_options.hpp>
#include <quorum/common/critical.hpp>
#include <quorum/schema/call.hpp>
#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/proposal_state.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = quorum::schema::encoding::encoder<
    quorum::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

const std::string& require(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    quorum::common::critical("missing required argument", name);
  }
  return vm[name].as<std::string>();
}

quorum::schema::address_t get_address(const po::variables_map& vm,
                                      const std::string& name) {
  auto address = quorum::schema::try_make_address(require(vm, name));
  if (!address) {
    quorum::common::critical("invalid address", name);
  }
  return *address;
}

quorum::schema::amount_t get_amount(const po::variables_map& vm) {
  auto amount = quorum::schema::try_make_amount(require(vm, "amount"));
  if (!amount) {
    quorum::common::critical("amount must be a decimal integer below 2^256");
  }
  return *amount;
}

uint64_t get_proposal_id(const po::variables_map& vm) {
  if (!vm.contains("proposal-id")) {
    quorum::common::critical("missing required argument", "proposal-id");
  }
  return vm["proposal-id"].as<uint64_t>();
}

quorum::schema::call_payload_t build_payload(const po::variables_map& vm) {
  auto payload = require(vm, "payload");
  if (payload == "submit") {
    return quorum::schema::submit_t{
        .version = 1, .to = get_address(vm, "to"), .amount = get_amount(vm)};
  }
  if (payload == "approve") {
    return quorum::schema::approve_t{.version = 1,
                                     .proposal_id = get_proposal_id(vm)};
  }
  if (payload == "revoke") {
    return quorum::schema::revoke_t{.version = 1,
                                    .proposal_id = get_proposal_id(vm)};
  }
  if (payload == "cancel-expired") {
    return quorum::schema::cancel_expired_t{
        .version = 1, .proposal_id = get_proposal_id(vm)};
  }
  quorum::common::critical("unsupported payload", payload);
}

quorum::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = require(vm, "path");
  if (path == "/state/roster" || path == "/state/count" ||
      path == "/state/balance") {
    return {};
  }
  if (path == "/state/proposal" || path == "/state/expired") {
    return encoder.encode(get_proposal_id(vm));
  }
  if (path == "/state/approval") {
    return encoder.encode(
        std::tuple{get_proposal_id(vm), get_address(vm, "custodian")});
  }
  if (path == "/events/range") {
    return encoder.encode(std::tuple{vm["from-index"].as<uint64_t>(),
                                     vm["to-index"].as<uint64_t>()});
  }
  quorum::common::critical("unsupported query path", path);
}

void print_proposal(const quorum::schema::proposal_state_t& proposal) {
  std::cout << "id=" << proposal.id << '\n'
            << "to=" << quorum::schema::to_hex(proposal.to) << '\n'
            << "amount=" << proposal.amount.str() << '\n'
            << "status=" << quorum::schema::to_string(proposal.status) << '\n'
            << "approvals=" << proposal.approval_count << '\n'
            << "created_at=" << proposal.created_at << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  quorum_call_builder call --payload <kind> [options]\n"
            << "  quorum_call_builder query-key --path <route> [options]\n"
            << "  quorum_call_builder decode-proposal --value <base64>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"quorum_call_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "call|query-key|decode-proposal")(
      "payload", po::value<std::string>(),
      "submit|approve|revoke|cancel-expired")(
      "caller", po::value<std::string>(), "calling custodian address hex")(
      "to", po::value<std::string>(), "transfer destination address hex")(
      "amount", po::value<std::string>(), "transfer amount, decimal")(
      "proposal-id", po::value<uint64_t>(), "proposal id")(
      "path", po::value<std::string>(), "query route")(
      "custodian", po::value<std::string>(), "custodian address hex")(
      "from-index", po::value<uint64_t>()->default_value(0),
      "first event index")("to-index",
                           po::value<uint64_t>()->default_value(0),
                           "event index past the last one")(
      "value", po::value<std::string>(), "base64 query value");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "call") {
    auto call = quorum::schema::call_t{.version = 1,
                                       .caller = get_address(vm, "caller"),
                                       .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(call);
    std::cout << quorum::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    auto key = build_query_key(vm);
    std::cout << quorum::schema::to_base64(key) << '\n';
    return 0;
  }

  if (command == "decode-proposal") {
    auto bytes = quorum::schema::try_from_base64(require(vm, "value"));
    if (!bytes) {
      quorum::common::critical("value is not valid base64");
    }
    auto proposal =
        encoder_t{}.try_decode<quorum::schema::proposal_state_t>(*bytes);
    if (!proposal) {
      quorum::common::critical("value is not an encoded proposal");
    }
    print_proposal(*proposal);
    return 0;
  }

  quorum::common::critical("command must be call|query-key|decode-proposal");
}
