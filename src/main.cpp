#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <vestlock/access/identity.hpp>
#include <vestlock/blake3/hash.hpp>
#include <vestlock/common/critical.hpp>
#include <vestlock/execution/engine.hpp>
#include <vestlock/ledger/storage_ledger.hpp>
#include <vestlock/schema/lock_error_code.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

namespace po = boost::program_options;
using namespace vestlock::schema;

namespace {

using encoder_t = vestlock::schema::encoding::encoder<
    vestlock::schema::encoding::scale_encoder_tag>;

void setup_logging(const std::string& log_file, const std::string& level) {
  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "vestlock", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    vestlock::common::critical("missing required option --" + name);
  }
  return vm[name].as<std::string>();
}

hash32_t require_hash32(const po::variables_map& vm, const std::string& name) {
  auto hash = try_make_hash32(require(vm, name));
  if (!hash.has_value()) {
    vestlock::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *hash;
}

amount_t require_amount(const po::variables_map& vm) {
  auto amount = try_make_amount(require(vm, "amount"));
  if (!amount.has_value()) {
    vestlock::common::critical("--amount must be a decimal 256-bit integer");
  }
  return *amount;
}

signer_id_t require_signer(const po::variables_map& vm) {
  auto signer = vestlock::access::try_make_signer_id(
      vm["signer-kind"].as<std::string>(), require(vm, "signer"));
  if (!signer.has_value()) {
    vestlock::common::critical("--signer does not match --signer-kind");
  }
  return *signer;
}

void print_result(const command_result_t& result) {
  std::cout << "code: " << result.code << " ("
            << to_string(result.error()) << ")\n";
  if (!result.log.empty()) {
    std::cout << "log: " << result.log << "\n";
  }
  if (!result.info.empty()) {
    std::cout << "info: " << result.info << "\n";
  }
  for (const auto& event : result.events) {
    std::cout << "event: " << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << " " << attribute.key << "=" << attribute.value;
    }
    std::cout << "\n";
  }
}

timestamp_milliseconds_t wall_clock_now() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace

int main(int argc, char* argv[]) {
  auto subcommand = std::string{};
  auto config_path = std::string{};
  auto db_path = std::string{};
  auto chain_seed = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto strict_crypto = true;

  auto general = po::options_description{"Vestlock"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style config file; command line options take precedence");

  auto settings = po::options_description{"Settings"};
  settings.add_options()(
      "db-path", po::value<std::string>(&db_path)->default_value("vestlock.db"),
      "RocksDB directory")(
      "chain-seed",
      po::value<std::string>(&chain_seed)->default_value("vestlock-chain"),
      "Seed hashed with BLAKE3 into the chain id")(
      "vault-id", po::value<std::string>(),
      "Vault account id (hex); defaults to BLAKE3 of 'vestlock-vault'")(
      "strict-crypto",
      po::value<bool>(&strict_crypto)->default_value(true),
      "Verify command signatures")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|err|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value(
                      "vestlock.log"),
      "Log file path");

  auto arguments = po::options_description{"Subcommand arguments"};
  arguments.add_options()("controller", po::value<std::string>(),
                          "Controller account id (hex)")(
      "command", po::value<std::string>(), "Command envelope (base64)")(
      "time", po::value<uint64_t>(),
      "Execution time in Unix milliseconds; defaults to the wall clock")(
      "path", po::value<std::string>(), "Query path")(
      "asset", po::value<std::string>(), "Asset id (hex)")(
      "signer", po::value<std::string>(), "Signer key or name (hex)")(
      "signer-kind", po::value<std::string>()->default_value("named"),
      "named|ed25519|secp256k1")("holder", po::value<std::string>(),
                                 "Ledger holder account id (hex)")(
      "from", po::value<std::string>(), "Source account id (hex)")(
      "to", po::value<std::string>(), "Destination account id (hex)")(
      "amount", po::value<std::string>(), "Decimal amount")(
      "native", "Credit native currency instead of an asset");

  auto hidden = po::options_description{};
  hidden.add_options()("subcommand", po::value<std::string>(&subcommand));
  auto positional = po::positional_options_description{};
  positional.add("subcommand", 1);

  auto visible = po::options_description{};
  visible.add(general).add(settings).add(arguments);
  auto all = po::options_description{};
  all.add(visible).add(hidden);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{vm["config"].as<std::string>()};
      if (!config) {
        std::cerr << "cannot open config file "
                  << vm["config"].as<std::string>() << "\n";
        return 1;
      }
      po::store(po::parse_config_file(config, settings), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n";
    return 1;
  }

  if (vm.contains("help") || subcommand.empty()) {
    std::cout << "usage: vestlock <init|execute|check|query|ledger-credit|"
                 "ledger-transfer> [options]\n"
              << visible << std::endl;
    return subcommand.empty() && !vm.contains("help") ? 1 : 0;
  }

  setup_logging(log_file, log_level);

  auto chain_id = vestlock::blake3::hash(std::string_view{chain_seed});
  auto vault_id =
      vm.contains("vault-id")
          ? require_hash32(vm, "vault-id")
          : vestlock::blake3::hash(std::string_view{"vestlock-vault"});

  auto encoder = encoder_t{};
  auto storage =
      vestlock::storage::make_storage<vestlock::storage::rocksdb_storage_tag>(
          db_path);
  auto ledger = vestlock::ledger::storage_ledger{storage, vault_id};
  auto engine = vestlock::execution::engine{encoder, storage, ledger, chain_id,
                                            strict_crypto};
  spdlog::info("Chain id {} vault {}", to_hex(chain_id), to_hex(vault_id));

  auto exit_code = 0;
  if (subcommand == "init") {
    auto result = engine.bootstrap(require_hash32(vm, "controller"));
    print_result(result);
    exit_code = result.ok() ? 0 : 2;
  } else if (subcommand == "execute" || subcommand == "check") {
    auto raw = try_from_base64(require(vm, "command"));
    if (!raw.has_value()) {
      vestlock::common::critical("--command must be base64");
    }
    auto result = command_result_t{};
    if (subcommand == "check") {
      result = engine.check_command(make_bytes_view(*raw));
    } else {
      auto now = vm.contains("time") ? vm["time"].as<uint64_t>()
                                     : wall_clock_now();
      result = engine.execute_command(make_bytes_view(*raw), now);
    }
    print_result(result);
    exit_code = result.ok() ? 0 : 2;
  } else if (subcommand == "query") {
    auto data = bytes_t{};
    if (vm.contains("asset")) {
      auto asset = require_hash32(vm, "asset");
      data.assign(asset.begin(), asset.end());
    } else if (vm.contains("signer")) {
      data = encoder.encode(require_signer(vm));
    }
    auto result = engine.query(require(vm, "path"), make_bytes_view(data));
    std::cout << "code: " << result.code << "\n";
    if (!result.log.empty()) {
      std::cout << "log: " << result.log << "\n";
    }
    std::cout << "value: " << to_hex(make_bytes_view(result.value)) << "\n";
    exit_code = result.code == 0 ? 0 : 2;
  } else if (subcommand == "ledger-credit") {
    auto credited =
        vm.contains("native")
            ? ledger.credit_native(require_hash32(vm, "holder"),
                                   require_amount(vm))
            : ledger.credit(require_hash32(vm, "asset"),
                            require_hash32(vm, "holder"), require_amount(vm));
    std::cout << "credit: " << (credited ? "applied" : "overflow") << "\n";
    exit_code = credited ? 0 : 2;
  } else if (subcommand == "ledger-transfer") {
    auto outcome = vestlock::ledger::classify(
        ledger.move(require_hash32(vm, "asset"), require_hash32(vm, "from"),
                    require_hash32(vm, "to"), require_amount(vm)));
    std::cout << "transfer: " << vestlock::ledger::to_string(outcome) << "\n";
    exit_code = vestlock::ledger::succeeded(outcome) ? 0 : 2;
  } else {
    spdlog::error("Unknown subcommand '{}'", subcommand);
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
