#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <anchor/common/critical.hpp>
#include <anchor/execution/engine.hpp>
#include <anchor/schema/enum_string.hpp>
#include <anchor/schema/primitives.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

anchor::schema::address_t parse_address(const std::string& value,
                                        const std::string_view name) {
  auto address = anchor::schema::try_make_address(value);
  if (!address) {
    anchor::common::critical("Option '{}' is not a 20-byte hex address: {}",
                             name, value);
  }
  return *address;
}

anchor::schema::amount_t parse_amount(const std::string& value,
                                      const std::string_view name) {
  auto amount = anchor::schema::try_make_amount(value);
  if (!amount) {
    anchor::common::critical("Option '{}' is not a decimal amount: {}", name,
                             value);
  }
  return *amount;
}

anchor::schema::address_t optional_address(const po::variables_map& vm,
                                           const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return parse_address(vm[name].as<std::string>(), name);
}

anchor::execution::genesis_config make_genesis(const po::variables_map& vm) {
  auto genesis = anchor::execution::genesis_config{};
  auto role = vm["role"].as<std::string>();
  auto parsed_role =
      anchor::schema::from_string(role, anchor::execution::kChainRoleMappings);
  if (!parsed_role) {
    anchor::common::critical("Unknown chain role '{}', expected hub|spoke", role);
  }
  genesis.role = *parsed_role;
  genesis.chain_id = vm["chain-id"].as<uint64_t>();
  genesis.owner = optional_address(vm, "owner");
  if (vm.contains("relayer")) {
    for (const auto& value : vm["relayer"].as<std::vector<std::string>>()) {
      genesis.relayers.push_back(parse_address(value, "relayer"));
    }
  }
  genesis.registry_address = optional_address(vm, "registry-address");
  genesis.hub_address = optional_address(vm, "hub-address");
  genesis.token_address = optional_address(vm, "token-address");
  genesis.spoke_address = optional_address(vm, "spoke-address");

  genesis.fees.verification_fee = parse_amount(
      vm["verification-fee"].as<std::string>(), "verification-fee");
  genesis.fees.cross_chain_fee = parse_amount(
      vm["cross-chain-fee"].as<std::string>(), "cross-chain-fee");
  genesis.treasury_bps = vm["treasury-bps"].as<uint16_t>();
  genesis.treasury_wallet = optional_address(vm, "treasury-wallet");
  if (vm.contains("burn-wallet")) {
    genesis.burn_wallet =
        parse_address(vm["burn-wallet"].as<std::string>(), "burn-wallet");
  }
  genesis.credit_payments_enabled = vm["credit-payments"].as<bool>();
  genesis.fee_collector = optional_address(vm, "fee-collector");
  genesis.voucher_fee =
      parse_amount(vm["voucher-fee"].as<std::string>(), "voucher-fee");

  if (vm.contains("allocation")) {
    for (const auto& value : vm["allocation"].as<std::vector<std::string>>()) {
      auto separator = value.find(':');
      if (separator == std::string::npos) {
        anchor::common::critical("Allocation '{}' must be <address>:<amount>",
                                 value);
      }
      genesis.token_allocations.emplace_back(
          parse_address(value.substr(0, separator), "allocation"),
          parse_amount(value.substr(separator + 1), "allocation"));
    }
  }
  return genesis;
}

// Block file rows: "<height> <unix-seconds> [<tx-hex> ...]". Blank rows and
// rows starting with '#' are ignored.
size_t replay_blocks(anchor::execution::engine& engine,
                     const std::string& block_file) {
  auto input = std::ifstream{block_file};
  if (!input) {
    anchor::common::critical("Unable to open block file {}", block_file);
  }
  auto replayed = size_t{0};
  auto line = std::string{};
  auto line_number = size_t{0};
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty() || line.front() == '#') {
      continue;
    }
    auto row = std::istringstream{line};
    auto height = uint64_t{};
    auto block_time = anchor::schema::timestamp_seconds_t{};
    if (!(row >> height >> block_time)) {
      anchor::common::critical("Malformed block header at {}:{}", block_file,
                               line_number);
    }
    auto txs = std::vector<anchor::schema::bytes_t>{};
    auto tx_hex = std::string{};
    while (row >> tx_hex) {
      auto tx = anchor::schema::try_from_hex(tx_hex);
      if (!tx) {
        spdlog::warn("Block {} carries non-hex transaction at {}:{}", height,
                     block_file, line_number);
        txs.emplace_back();
        continue;
      }
      txs.push_back(std::move(*tx));
    }

    auto block = engine.finalize_block(height, block_time, txs);
    for (size_t i = 0; i < block.tx_results.size(); ++i) {
      const auto& result = block.tx_results[i];
      if (result.code == 0) {
        spdlog::info("  tx {} ok ({} event(s))", i, result.events.size());
      } else {
        spdlog::info("  tx {} rejected [{}:{}] {} {}", i, result.codespace,
                     result.code, result.log, result.info);
      }
    }
    auto committed = engine.commit();
    spdlog::info(
        "Committed block {} state root {}", committed.committed_height,
        anchor::schema::to_hex(anchor::schema::bytes_view_t{committed.state_root}));
    ++replayed;
  }
  return replayed;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto config_path = std::string{};
  auto block_file = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};

  auto vm = po::variables_map{};
  auto generic = po::options_description{"Anchor"};
  generic.add_options()("help,h", "Show the help message")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("anchor.db"),
      "RocksDB directory for chain state")(
      "config,c", po::value<std::string>(&config_path),
      "INI file carrying the genesis options below")(
      "block-file,b", po::value<std::string>(&block_file),
      "replay blocks from file, one block per line")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error")(
      "log-file", po::value<std::string>(&log_file)->default_value("anchor.log"),
      "log file path");

  auto genesis_options = po::options_description{"Genesis"};
  genesis_options.add_options()(
      "role", po::value<std::string>()->default_value("hub"), "hub|spoke")(
      "chain-id", po::value<uint64_t>()->default_value(1), "local chain id")(
      "owner", po::value<std::string>(), "owner address hex")(
      "relayer", po::value<std::vector<std::string>>()->multitoken(),
      "initial relayer address hex")(
      "registry-address", po::value<std::string>(), "registry unit address")(
      "hub-address", po::value<std::string>(), "voucher hub unit address")(
      "token-address", po::value<std::string>(), "fee token unit address")(
      "spoke-address", po::value<std::string>(), "voucher spoke unit address")(
      "verification-fee", po::value<std::string>()->default_value("0"),
      "base verification fee")(
      "cross-chain-fee", po::value<std::string>()->default_value("0"),
      "fee per target chain")(
      "treasury-bps", po::value<uint16_t>()->default_value(10000),
      "treasury share in basis points")(
      "treasury-wallet", po::value<std::string>(), "treasury address hex")(
      "burn-wallet", po::value<std::string>(), "burn address hex")(
      "credit-payments", po::value<bool>()->default_value(false),
      "enable relayer credit payments")(
      "fee-collector", po::value<std::string>(), "hub fee collector address")(
      "voucher-fee", po::value<std::string>()->default_value("0"),
      "advertised voucher fee")(
      "allocation", po::value<std::vector<std::string>>()->multitoken(),
      "initial token balance <address>:<amount>");

  auto description = po::options_description{};
  description.add(generic).add(genesis_options);
  po::store(po::parse_command_line(argc, argv, description), vm);
  if (vm.contains("config")) {
    po::store(
        po::parse_config_file<char>(vm["config"].as<std::string>().c_str(),
                                    genesis_options),
        vm);
  }
  po::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "anchor", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto encoder = anchor::execution::engine::encoder_t{};
  auto storage =
      anchor::storage::make_storage<anchor::storage::rocksdb_storage_tag>(
          db_path);
  auto engine =
      anchor::execution::engine{encoder, storage, make_genesis(vm)};

  if (!block_file.empty()) {
    auto replayed = replay_blocks(engine, block_file);
    spdlog::info("Replayed {} block(s) from {}", replayed, block_file);
  }

  auto info = engine.info();
  spdlog::info("{} {} at height {}", info.data, info.version,
               info.last_block_height);

  spdlog::shutdown();
  return 0;
}
