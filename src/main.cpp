#include <spdlog/async.h>
#include <spdlog/fmt/chrono.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <warden/authorization/ledger.hpp>
#include <warden/blake3/hash.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <warden/vault/vault.hpp>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

namespace po = boost::program_options;

struct deploy_options final {
  std::string ledger_db;
  std::string vault_db;
  std::string domain;
  std::string network;
  std::string ledger_address;
  std::string vault_address;
  std::string summary;
  std::string log_file;
  bool verbose{};
};

void configure_logging(const deploy_options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "deploy", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(options.verbose ? spdlog::level::debug
                                    : spdlog::level::info);
}

// Stand-in for a deployer-assigned address: the first 20 bytes of
// BLAKE3(role || store path).
warden::schema::address_t derive_address(const std::string_view role,
                                         const std::string& store_path) {
  auto digest = warden::blake3::hash(std::string{role} + "|" + store_path);
  auto address = warden::schema::address_t{};
  std::copy_n(std::begin(digest), address.size(), std::begin(address));
  return address;
}

std::optional<warden::schema::address_t> resolve_address(
    const std::string& hex,
    const std::string_view role,
    const std::string& store_path) {
  if (hex.empty()) {
    return derive_address(role, store_path);
  }
  auto parsed = warden::schema::try_make_address(hex);
  if (!parsed || warden::schema::is_null(*parsed)) {
    spdlog::error("Invalid {} address '{}'", role, hex);
    return std::nullopt;
  }
  return parsed;
}

std::optional<warden::schema::domain_id_t> resolve_domain(
    const deploy_options& options) {
  if (options.domain.empty()) {
    return warden::blake3::hash(std::string_view{options.network});
  }
  auto parsed = warden::schema::try_make_hash32(options.domain);
  if (!parsed) {
    spdlog::error("Domain must be 32 bytes of hex, got '{}'", options.domain);
  }
  return parsed;
}

std::string utc_timestamp() {
  auto now = std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now());
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(now));
}

int deploy(const deploy_options& options) {
  spdlog::info("========== DEPLOYMENT START ==========");

  auto domain = resolve_domain(options);
  auto ledger_address =
      resolve_address(options.ledger_address, "ledger", options.ledger_db);
  auto vault_address =
      resolve_address(options.vault_address, "vault", options.vault_db);
  if (!domain || !ledger_address || !vault_address) {
    return 1;
  }
  spdlog::info("Network '{}' domain {}", options.network,
               warden::schema::to_hex(*domain));

  spdlog::info("--- Provisioning authorization ledger ---");
  auto ledger_store =
      warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(
          options.ledger_db);
  auto ledger = warden::authorization::authorization_ledger{ledger_store,
                                                            *ledger_address};
  spdlog::info("Authorization ledger deployed at {}",
               warden::schema::to_hex(ledger.identity()));

  spdlog::info("--- Provisioning vault ---");
  auto vault_store =
      warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(
          options.vault_db);
  auto vault = warden::vault::vault{
      vault_store, *vault_address, *domain,
      [](const warden::schema::address_t& recipient,
         const warden::schema::amount_t& amount) {
        spdlog::error("No settlement backend; refusing transfer of {} to {}",
                      amount.str(), warden::schema::to_hex(recipient));
        return false;
      }};
  spdlog::info("Vault deployed at {}",
               warden::schema::to_hex(vault.identity()));

  spdlog::info("--- Initializing vault ---");
  auto initialized = vault.initialize(&ledger);
  if (initialized.code != warden::schema::error_code::ok) {
    spdlog::error("Vault initialization failed: {} ({})",
                  warden::schema::to_string(initialized.code),
                  initialized.log);
    return 1;
  }
  spdlog::info("Initialization verified: {}", vault.is_initialized());
  if (!vault.is_initialized()) {
    return 1;
  }

  auto summary = boost::property_tree::ptree{};
  summary.put("network.name", options.network);
  summary.put("network.domain", warden::schema::to_hex(*domain));
  summary.put("network.timestamp", utc_timestamp());
  summary.put("components.authorization_ledger.address",
              warden::schema::to_hex(ledger.identity()));
  summary.put("components.authorization_ledger.store", options.ledger_db);
  summary.put("components.vault.address",
              warden::schema::to_hex(vault.identity()));
  summary.put("components.vault.authorization_ledger_address",
              warden::schema::to_hex(ledger.identity()));
  summary.put("components.vault.store", options.vault_db);
  summary.put("components.vault.balance", vault.balance().str());

  auto output = std::ofstream{options.summary};
  if (!output) {
    spdlog::error("Cannot open deployment summary '{}'", options.summary);
    return 1;
  }
  boost::property_tree::write_json(output, summary);
  spdlog::info("Deployment summary written to {}", options.summary);
  spdlog::info("========== DEPLOYMENT SUCCESS ==========");
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = deploy_options{};
  auto config_file = std::string{};

  auto description = po::options_description{"warden_deploy"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with the same option names")(
      "ledger-db",
      po::value<std::string>(&options.ledger_db)
          ->default_value("warden-ledger.db"),
      "RocksDB path for the authorization ledger")(
      "vault-db",
      po::value<std::string>(&options.vault_db)
          ->default_value("warden-vault.db"),
      "RocksDB path for the vault")(
      "domain", po::value<std::string>(&options.domain),
      "32-byte domain separator hex; overrides --network")(
      "network",
      po::value<std::string>(&options.network)->default_value("warden-local"),
      "network name hashed into the domain separator")(
      "ledger-address", po::value<std::string>(&options.ledger_address),
      "20-byte ledger address hex")(
      "vault-address", po::value<std::string>(&options.vault_address),
      "20-byte vault address hex")(
      "summary",
      po::value<std::string>(&options.summary)
          ->default_value("deployment.json"),
      "deployment summary output path")(
      "log-file",
      po::value<std::string>(&options.log_file)->default_value("warden.log"),
      "log file path")("verbose,v", "Enable debug logging");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
    if (!config_file.empty()) {
      po::store(po::parse_config_file<char>(config_file.c_str(), description),
                vm);
      po::notify(vm);
    }
  } catch (const po::error& ex) {
    std::cerr << "warden_deploy: " << ex.what() << '\n' << description;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }
  options.verbose = vm.contains("verbose");

  configure_logging(options);
  auto exit_code = 1;
  try {
    exit_code = deploy(options);
  } catch (const std::exception& ex) {
    spdlog::error("Deployment failed: {}", ex.what());
  }
  spdlog::shutdown();
  return exit_code;
}
