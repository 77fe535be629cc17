#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <quorum/crypto/signing_key.hpp>
#include <quorum/offchain/coordinator.hpp>
#include <quorum/storage/rocksdb/storage.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

namespace po = boost::program_options;

using coordinator_t =
    quorum::offchain::coordinator<quorum::storage::rocksdb_storage_tag>;

// The CLI only touches the local store; anything that needs the chain fails.
quorum::offchain::network_t make_offline_network() {
  auto offline = [] { return std::runtime_error{"no network transport"}; };
  return quorum::offchain::network_t{
      .account_permission =
          [offline](const quorum::schema::address_t&)
          -> std::optional<quorum::schema::custodian_roster_t> {
        throw offline();
      },
      .latest_block = [offline]() -> quorum::schema::block_reference_t {
        throw offline();
      },
      .broadcast = [offline](const quorum::schema::signed_transfer_t&)
          -> quorum::schema::broadcast_receipt_t { throw offline(); },
      .transaction_info =
          [offline](const quorum::schema::hash32_t&)
          -> std::optional<quorum::schema::transaction_info_t> {
        throw offline();
      },
      .now = [offline]() -> quorum::schema::timestamp_milliseconds_t {
        throw offline();
      }};
}

void print_record(const quorum::schema::pending_transaction_t& record) {
  std::cout << "id=" << quorum::schema::to_hex(record.id) << '\n'
            << "tx_id=" << quorum::schema::to_hex(record.tx_id) << '\n'
            << "from=" << quorum::schema::to_hex(record.from) << '\n'
            << "to=" << quorum::schema::to_hex(record.to) << '\n'
            << "amount=" << record.amount.str() << '\n'
            << "asset="
            << (quorum::schema::is_token(record.asset) ? "token" : "native")
            << '\n'
            << "signatures=" << record.signers.size() << '/'
            << record.threshold << '\n'
            << "status=" << quorum::schema::to_string(record.status) << '\n'
            << "created_at=" << record.created_at << '\n'
            << "expires_at=" << record.expires_at << '\n';
  for (const auto& signer : record.signers) {
    std::cout << "signer=" << quorum::schema::to_hex(signer) << '\n';
  }
  if (record.description) {
    std::cout << "description=" << *record.description << '\n';
  }
  if (record.error_message) {
    std::cout << "error=" << *record.error_message << '\n';
  }
}

int report(const quorum::schema::coordinator_result_t& result) {
  if (result.code != 0) {
    spdlog::error("[{}:{}] {} {}", result.codespace, result.code, result.log,
                  result.info);
    return 1;
  }
  if (result.record) {
    print_record(*result.record);
  }
  return 0;
}

std::optional<quorum::crypto::signing_key> load_key(
    const po::variables_map& vm) {
  if (!vm.contains("private-key")) {
    spdlog::error("--private-key is required");
    return std::nullopt;
  }
  auto bytes =
      quorum::schema::try_from_hex(vm["private-key"].as<std::string>());
  if (!bytes || bytes->size() != 32) {
    spdlog::error("private key must be 32 bytes of hex");
    return std::nullopt;
  }
  auto private_key = quorum::schema::secp256k1_private_key_t{};
  std::ranges::copy(*bytes, std::begin(private_key));
  auto key = quorum::crypto::signing_key::from_private_key(private_key);
  if (!key) {
    spdlog::error("private key is not a valid secp256k1 scalar");
  }
  return key;
}

std::optional<quorum::schema::hash32_t> load_id(const po::variables_map& vm) {
  if (!vm.contains("id")) {
    spdlog::error("--id is required");
    return std::nullopt;
  }
  auto id = quorum::schema::try_make_hash32(vm["id"].as<std::string>());
  if (!id) {
    spdlog::error("id must be 32 bytes of hex");
  }
  return id;
}

std::optional<quorum::schema::bytes_t> decode_blob(const std::string& blob,
                                                   const std::string& format) {
  if (format == "hex") {
    return quorum::schema::try_from_hex(blob);
  }
  return quorum::schema::try_from_base64(blob);
}

std::string encode_blob(const quorum::schema::bytes_t& blob,
                        const std::string& format) {
  if (format == "hex") {
    return quorum::schema::to_hex(blob);
  }
  return quorum::schema::to_base64(blob);
}

int run_store_command(const std::string& command,
                      const po::variables_map& vm) {
  auto key = load_key(vm);
  if (!key) {
    return 1;
  }
  auto options = quorum::offchain::coordinator_options{};
  if (vm.contains("account")) {
    auto account =
        quorum::schema::try_make_address(vm["account"].as<std::string>());
    if (!account) {
      spdlog::error("account must be a 20-byte address");
      return 1;
    }
    options.account = *account;
  }

  auto storage = quorum::storage::make_storage<
      quorum::storage::rocksdb_storage_tag>(vm["db"].as<std::string>());
  auto coordinator = coordinator_t{storage, std::move(*key),
                                   make_offline_network(), options};
  auto format = vm["format"].as<std::string>();

  if (command == "list") {
    for (const auto& record : coordinator.list()) {
      std::cout << quorum::schema::to_hex(record.id) << ' '
                << quorum::schema::to_string(record.status) << ' '
                << record.signers.size() << '/' << record.threshold << ' '
                << record.amount.str() << '\n';
    }
    return 0;
  }

  // Offline, every settlement lookup fails; only local expiry applies.
  if (command == "expire") {
    coordinator.reconcile();
    return 0;
  }

  if (command == "import") {
    if (!vm.contains("blob")) {
      spdlog::error("--blob is required");
      return 1;
    }
    auto blob = decode_blob(vm["blob"].as<std::string>(), format);
    if (!blob) {
      spdlog::error("blob is not valid {}", format);
      return 1;
    }
    return report(
        coordinator.import_and_merge(quorum::schema::make_bytes_view(*blob)));
  }

  auto id = load_id(vm);
  if (!id) {
    return 1;
  }
  if (command == "show") {
    auto record = coordinator.get(*id);
    if (!record) {
      spdlog::error("pending transaction {} not found",
                    quorum::schema::to_hex(*id));
      return 1;
    }
    print_record(*record);
    return 0;
  }
  if (command == "export") {
    auto blob = coordinator.export_record(*id);
    if (!blob) {
      spdlog::error("pending transaction {} not found",
                    quorum::schema::to_hex(*id));
      return 1;
    }
    std::cout << encode_blob(*blob, format) << '\n';
    return 0;
  }
  if (command == "sign") {
    return report(coordinator.sign(*id));
  }
  if (command == "delete") {
    return report(coordinator.remove(*id));
  }

  spdlog::error("unknown command '{}'", command);
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("quorum.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "quorum", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  auto command = std::string{};
  auto config_path = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Quorum"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command),
      "keygen|address|list|show|export|import|sign|delete|expire")(
      "config,c", po::value<std::string>(&config_path),
      "Read options from a config file")(
      "db,d", po::value<std::string>()->default_value("quorum.db"),
      "Pending transaction store path")(
      "private-key,k", po::value<std::string>(), "Local custodian key hex")(
      "account,a", po::value<std::string>(), "Multi-key account address hex")(
      "id,i", po::value<std::string>(), "Pending transaction id hex")(
      "blob,b", po::value<std::string>(), "Exported record to import")(
      "format,f", po::value<std::string>()->default_value("base64"),
      "base64|hex")("verbose,v", po::bool_switch(), "Enable verbose output");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
    if (!config_path.empty()) {
      if (!std::filesystem::exists(config_path)) {
        spdlog::error("config file {} does not exist", config_path);
        spdlog::shutdown();
        return 1;
      }
      po::store(po::parse_config_file(config_path.c_str(), description), vm);
      po::notify(vm);
    }
  } catch (const po::error& e) {
    spdlog::error("{}", e.what());
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  spdlog::set_level(vm["verbose"].as<bool>() ? spdlog::level::debug
                                             : spdlog::level::info);

  auto exit_code = 0;
  if (command == "keygen") {
    auto key = quorum::crypto::signing_key::generate();
    if (!key) {
      spdlog::error("key generation failed");
      exit_code = 1;
    } else {
      std::cout << "private_key=" << quorum::schema::to_hex(key->private_key())
                << '\n'
                << "address=" << quorum::schema::to_hex(key->address())
                << '\n';
    }
  } else if (command == "address") {
    auto key = load_key(vm);
    if (!key) {
      exit_code = 1;
    } else {
      std::cout << quorum::schema::to_hex(key->address()) << '\n';
    }
  } else {
    exit_code = run_store_command(command, vm);
  }

  spdlog::shutdown();
  return exit_code;
}
