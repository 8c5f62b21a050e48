#include <boost/program_options.hpp>
#include <anchor/blake3/hash.hpp>
#include <anchor/common/critical.hpp>
#include <anchor/protocol/timelock.hpp>
#include <anchor/protocol/verification_registry.hpp>
#include <anchor/protocol/voucher_spoke.hpp>
#include <anchor/schema/encoding/scale/encoder.hpp>
#include <anchor/schema/transaction.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = anchor::schema::encoding::encoder<
    anchor::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

anchor::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  if (!vm.contains(name)) {
    anchor::common::critical("missing required hash argument");
  }
  return anchor::schema::make_hash32(vm[name].as<std::string>());
}

anchor::schema::address_t get_address(const po::variables_map& vm,
                                      const std::string& name) {
  if (!vm.contains(name)) {
    anchor::common::critical("missing required address argument");
  }
  return anchor::schema::make_address(vm[name].as<std::string>());
}

anchor::schema::amount_t parse_amount(const std::string& value) {
  auto amount = anchor::schema::try_make_amount(value);
  if (!amount) {
    anchor::common::critical("amount must be a decimal integer");
  }
  return *amount;
}

anchor::schema::amount_t get_amount(const po::variables_map& vm) {
  return parse_amount(vm["amount"].as<std::string>());
}

std::vector<anchor::schema::hash32_t> get_q_hashes(const po::variables_map& vm) {
  auto hashes = std::vector<anchor::schema::hash32_t>{};
  if (vm.contains("q-hash")) {
    for (const auto& value : vm["q-hash"].as<std::vector<std::string>>()) {
      hashes.push_back(anchor::schema::make_hash32(value));
    }
  }
  return hashes;
}

anchor::schema::hash32_t get_q_hash(const po::variables_map& vm) {
  auto hashes = get_q_hashes(vm);
  if (hashes.size() != 1) {
    anchor::common::critical("exactly one --q-hash is required");
  }
  return hashes.front();
}

std::vector<anchor::schema::chain_id_t> get_target_chains(
    const po::variables_map& vm) {
  if (!vm.contains("target-chain")) {
    return {};
  }
  return vm["target-chain"].as<std::vector<anchor::schema::chain_id_t>>();
}

anchor::schema::chain_id_t get_target_chain(const po::variables_map& vm) {
  auto chains = get_target_chains(vm);
  if (chains.size() != 1) {
    anchor::common::critical("exactly one --target-chain is required");
  }
  return chains.front();
}

anchor::schema::timelock_action_t get_action(const po::variables_map& vm) {
  if (!vm.contains("action")) {
    anchor::common::critical("missing required --action");
  }
  auto action = anchor::schema::try_from_string<anchor::schema::timelock_action_t>(
      vm["action"].as<std::string>());
  if (!action) {
    anchor::common::critical("unknown timelock action");
  }
  return *action;
}

// Value text per action: an address for the wallet and collaborator actions,
// "<base>:<per-chain>" for the fee schedule, basis points for the split and a
// decimal amount for the voucher fee.
anchor::schema::change_value_t parse_change_value(
    const anchor::schema::timelock_action_t action,
    const std::string& value) {
  switch (action) {
    case anchor::schema::timelock_action_t::set_fee_schedule: {
      auto separator = value.find(':');
      if (separator == std::string::npos) {
        anchor::common::critical("fee schedule value must be <base>:<per-chain>");
      }
      return anchor::schema::fee_schedule_t{
          .verification_fee = parse_amount(value.substr(0, separator)),
          .cross_chain_fee = parse_amount(value.substr(separator + 1))};
    }
    case anchor::schema::timelock_action_t::set_treasury_split: {
      auto bps = static_cast<uint16_t>(std::stoul(value));
      return bps;
    }
    case anchor::schema::timelock_action_t::set_voucher_fee:
      return parse_amount(value);
    default:
      return anchor::schema::make_address(value);
  }
}

anchor::schema::change_value_t get_change_value(
    const po::variables_map& vm,
    const anchor::schema::timelock_action_t action) {
  if (!vm.contains("value")) {
    anchor::common::critical("missing required --value");
  }
  return parse_change_value(action, vm["value"].as<std::string>());
}

anchor::schema::pause_scope_t get_scope(const po::variables_map& vm) {
  auto scope = anchor::schema::try_from_string<anchor::schema::pause_scope_t>(
      vm["scope"].as<std::string>());
  if (!scope) {
    anchor::common::critical("scope must be global|voucher_creation|cross_chain");
  }
  return *scope;
}

// "<voucher-id>:<q-hash>:<verifier>:<source-chain>:<verified-at>"
anchor::schema::fulfillment_params_t parse_fulfillment(const std::string& text) {
  auto fields = std::vector<std::string>{};
  auto stream = std::istringstream{text};
  auto field = std::string{};
  while (std::getline(stream, field, ':')) {
    fields.push_back(field);
  }
  if (fields.size() != 5) {
    anchor::common::critical("fulfillment must carry five ':' separated fields");
  }
  return anchor::schema::fulfillment_params_t{
      .voucher_id = anchor::schema::make_hash32(fields[0]),
      .q_hash = anchor::schema::make_hash32(fields[1]),
      .verifier = anchor::schema::make_address(fields[2]),
      .source_chain_id = std::stoull(fields[3]),
      .verified_at = std::stoull(fields[4])};
}

std::vector<anchor::schema::fulfillment_params_t> get_fulfillments(
    const po::variables_map& vm) {
  auto params = std::vector<anchor::schema::fulfillment_params_t>{};
  if (vm.contains("fulfillment")) {
    for (const auto& value :
         vm["fulfillment"].as<std::vector<std::string>>()) {
      params.push_back(parse_fulfillment(value));
    }
  }
  return params;
}

anchor::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "verify_data") {
    return anchor::schema::verify_data_t{
        .user = get_address(vm, "user"),
        .q_hash = get_q_hash(vm),
        .target_chain_ids = get_target_chains(vm),
        .proof_id = vm["proof-id"].as<std::string>(),
        .verification_type = vm["verification-type"].as<std::string>()};
  }
  if (payload == "confirm_chain_verification") {
    return anchor::schema::confirm_chain_verification_t{
        .q_hash = get_q_hash(vm), .chain_id = get_target_chain(vm)};
  }
  if (payload == "confirm_chain_verification_batch") {
    return anchor::schema::confirm_chain_verification_batch_t{
        .q_hashes = get_q_hashes(vm), .chain_ids = get_target_chains(vm)};
  }
  if (payload == "register_verifier") {
    return anchor::schema::register_verifier_t{
        .verification_type = vm["verification-type"].as<std::string>()};
  }
  if (payload == "set_verifier_active") {
    return anchor::schema::set_verifier_active_t{
        .verifier_id = get_hash32(vm, "verifier-id"),
        .active = vm["enabled"].as<bool>()};
  }
  if (payload == "deposit_relayer_credits") {
    return anchor::schema::deposit_relayer_credits_t{.amount = get_amount(vm)};
  }
  if (payload == "allocate_user_credits") {
    return anchor::schema::allocate_user_credits_t{
        .user = get_address(vm, "user"), .amount = get_amount(vm)};
  }
  if (payload == "set_credit_payments") {
    return anchor::schema::set_credit_payments_t{
        .enabled = vm["enabled"].as<bool>()};
  }
  if (payload == "set_relayer") {
    return anchor::schema::set_relayer_t{
        .relayer = get_address(vm, "relayer"),
        .authorized = vm["enabled"].as<bool>()};
  }
  if (payload == "schedule_change") {
    auto action = get_action(vm);
    return anchor::schema::schedule_change_t{
        .action = action, .value = get_change_value(vm, action)};
  }
  if (payload == "execute_change") {
    return anchor::schema::execute_change_t{.action = get_action(vm)};
  }
  if (payload == "set_pause") {
    return anchor::schema::set_pause_t{
        .scope = get_scope(vm),
        .paused = vm["enabled"].as<bool>(),
        .reason = vm["reason"].as<std::string>()};
  }
  if (payload == "create_voucher") {
    return anchor::schema::create_voucher_t{
        .q_hash = get_q_hash(vm),
        .target_chain_ids = get_target_chains(vm),
        .verifier_id = get_hash32(vm, "verifier-id")};
  }
  if (payload == "create_voucher_batch") {
    return anchor::schema::create_voucher_batch_t{
        .q_hashes = get_q_hashes(vm),
        .chain_ids = get_target_chains(vm),
        .verifier_id = get_hash32(vm, "verifier-id")};
  }
  if (payload == "confirm_voucher_fulfilled") {
    return anchor::schema::confirm_voucher_fulfilled_t{
        .voucher_id = get_hash32(vm, "voucher-id"),
        .q_hash = get_q_hash(vm),
        .chain_id = get_target_chain(vm)};
  }
  if (payload == "fulfill_voucher_batch") {
    return anchor::schema::fulfill_voucher_batch_t{
        .batch_id = get_hash32(vm, "batch-id"),
        .params = get_fulfillments(vm)};
  }
  if (payload == "token_approve") {
    return anchor::schema::token_approve_t{
        .spender = get_address(vm, "spender"), .amount = get_amount(vm)};
  }
  if (payload == "token_transfer") {
    return anchor::schema::token_transfer_t{
        .to = get_address(vm, "recipient"), .amount = get_amount(vm)};
  }
  anchor::common::critical("unsupported payload type");
}

anchor::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/registry/config" ||
      path == "/hub/config" || path == "/spoke/config") {
    return {};
  }
  if (path == "/registry/verification" || path == "/registry/status" ||
      path == "/spoke/anchor") {
    return encoder.encode(get_q_hash(vm));
  }
  if (path == "/registry/chain_confirmed") {
    return encoder.encode(std::tuple{get_q_hash(vm), get_target_chain(vm)});
  }
  if (path == "/registry/verifier") {
    return encoder.encode(get_hash32(vm, "verifier-id"));
  }
  if (path == "/registry/relayer") {
    return encoder.encode(get_address(vm, "relayer"));
  }
  if (path == "/registry/credits") {
    return encoder.encode(
        std::tuple{get_address(vm, "relayer"), get_address(vm, "user")});
  }
  if (path == "/registry/nonce") {
    return encoder.encode(get_address(vm, "user"));
  }
  if (path == "/registry/fee_quote") {
    return encoder.encode(static_cast<uint32_t>(get_target_chains(vm).size()));
  }
  if (path == "/hub/voucher" || path == "/spoke/fulfilled") {
    return encoder.encode(get_hash32(vm, "voucher-id"));
  }
  if (path == "/hub/fulfilled") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "voucher-id"), get_target_chain(vm)});
  }
  if (path == "/spoke/batch") {
    return encoder.encode(get_hash32(vm, "batch-id"));
  }
  if (path == "/token/balance") {
    return encoder.encode(get_address(vm, "user"));
  }
  if (path == "/token/allowance") {
    return encoder.encode(
        std::tuple{get_address(vm, "user"), get_address(vm, "spender")});
  }
  if (path == "/history/range") {
    return encoder.encode(std::tuple{vm["from-height"].as<uint64_t>(),
                                     vm["to-height"].as<uint64_t>()});
  }
  anchor::common::critical("unsupported query path");
}

// Deterministic test address: the trailing 20 bytes of hash(label).
anchor::schema::address_t make_labeled_address(const std::string& label) {
  auto digest = anchor::blake3::hash(std::string_view{label});
  auto address = anchor::schema::address_t{};
  std::copy(std::end(digest) - address.size(), std::end(digest),
            std::begin(address));
  return address;
}

void print_hex(const anchor::schema::bytes_view_t& bytes) {
  std::cout << anchor::schema::to_hex(bytes) << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  anchor-tx transaction [options]\n"
            << "  anchor-tx query-key [options]\n"
            << "  anchor-tx verifier-id --verification-type <type>\n"
            << "  anchor-tx proposal-id --action <action> --value <value>\n"
            << "  anchor-tx batch-digest --fulfillment <params> ...\n"
            << "  anchor-tx address --label <text>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"anchor-tx options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|verifier-id|proposal-id|batch-digest|address")(
      "payload", po::value<std::string>(), "transaction payload type")(
      "path", po::value<std::string>(), "query path")(
      "chain-id", po::value<uint64_t>()->default_value(1),
      "chain id of the executing chain")(
      "nonce", po::value<uint64_t>()->default_value(1), "sender nonce")(
      "sender", po::value<std::string>(), "sender address hex")(
      "to", po::value<std::string>(), "target unit address hex")(
      "user", po::value<std::string>(), "user address hex")(
      "q-hash", po::value<std::vector<std::string>>()->multitoken(),
      "qHash hash32 hex values")(
      "target-chain",
      po::value<std::vector<anchor::schema::chain_id_t>>()->multitoken(),
      "target chain ids")("proof-id",
                          po::value<std::string>()->default_value(""),
                          "proof identifier")(
      "verification-type", po::value<std::string>()->default_value(""),
      "verification type")("verifier-id", po::value<std::string>(),
                           "verifier hash32 hex")(
      "voucher-id", po::value<std::string>(), "voucher hash32 hex")(
      "batch-id", po::value<std::string>(), "batch hash32 hex")(
      "fulfillment", po::value<std::vector<std::string>>()->multitoken(),
      "voucher:qhash:verifier:source-chain:verified-at")(
      "relayer", po::value<std::string>(), "relayer address hex")(
      "spender", po::value<std::string>(), "spender address hex")(
      "recipient", po::value<std::string>(), "transfer recipient hex")(
      "amount", po::value<std::string>()->default_value("0"),
      "decimal token amount")("enabled",
                              po::value<bool>()->default_value(true),
                              "flag for active/authorized/paused/enabled")(
      "action", po::value<std::string>(), "timelock action name")(
      "value", po::value<std::string>(), "timelock change value")(
      "scope", po::value<std::string>()->default_value("global"),
      "global|voucher_creation|cross_chain")(
      "reason", po::value<std::string>()->default_value(""), "pause reason")(
      "label", po::value<std::string>(), "address label")(
      "from-height", po::value<uint64_t>()->default_value(1),
      "history range from")(
      "to-height", po::value<uint64_t>()->default_value(1), "history range to");

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

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      anchor::common::critical("transaction mode requires --payload");
    }
    auto transaction = anchor::schema::transaction_t{
        .version = 1,
        .chain_id = vm["chain-id"].as<uint64_t>(),
        .nonce = vm["nonce"].as<uint64_t>(),
        .sender = get_address(vm, "sender"),
        .to = get_address(vm, "to"),
        .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    print_hex(encoded);
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      anchor::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    print_hex(key);
    return 0;
  }

  if (command == "verifier-id") {
    print_hex(anchor::protocol::make_verifier_id(
        vm["verification-type"].as<std::string>()));
    return 0;
  }

  if (command == "proposal-id") {
    auto action = get_action(vm);
    print_hex(anchor::protocol::make_proposal_id(
        action, get_change_value(vm, action)));
    return 0;
  }

  if (command == "batch-digest") {
    print_hex(anchor::protocol::make_batch_digest(get_fulfillments(vm)));
    return 0;
  }

  if (command == "address") {
    if (!vm.contains("label")) {
      anchor::common::critical("address mode requires --label");
    }
    print_hex(make_labeled_address(vm["label"].as<std::string>()));
    return 0;
  }

  anchor::common::critical(
      "command must be "
      "transaction|query-key|verifier-id|proposal-id|batch-digest|address");
}
