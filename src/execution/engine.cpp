#include <spdlog/spdlog.h>
#include <algorithm>
#include <anchor/blake3/hash.hpp>
#include <anchor/common/critical.hpp>
#include <anchor/execution/engine.hpp>
#include <anchor/protocol/result.hpp>
#include <anchor/schema/key/engine_keys.hpp>
#include <anchor/schema/query_error_code.hpp>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

using namespace anchor::schema;

namespace {

namespace protocol = anchor::protocol;
using encoder_t = anchor::execution::engine::encoder_t;

inline constexpr std::string_view kQueryCodespace{"anchor.query"};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index,
                         uint32_t code) {
  auto encoder = encoder_t{};
  auto suffix = encoder.encode_all(height, index, code);
  return anchor::blake3::hash(
      {bytes_view_t{seed}, bytes_view_t{tx}, bytes_view_t{suffix}});
}

std::optional<transaction_t> decode_transaction(encoder_t& encoder,
                                                const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto decoded = encoder.try_decode<transaction_t>(raw_tx);
  if (!decoded) {
    error = "malformed SCALE transaction";
    return std::nullopt;
  }
  return decoded;
}

query_result_t fail(query_result_t result,
                    const query_error_code code,
                    const std::string_view log,
                    std::string info = {}) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.info = std::move(info);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

query_result_t invalid_key(query_result_t result, const std::string_view path) {
  return fail(std::move(result), query_error_code::invalid_key,
              "invalid query key", std::string{path});
}

query_result_t not_found(query_result_t result) {
  return fail(std::move(result), query_error_code::not_found, "not found");
}

transaction_result_t unsupported_operation(const std::string_view unit) {
  return protocol::make_error(transaction_error_code::unsupported_operation,
                              protocol::kEngineCodespace,
                              "operation not supported by unit",
                              std::string{unit});
}

template <typename T>
anchor::storage::key_value_entry_t make_entry(encoder_t& encoder,
                                              bytes_t key,
                                              const T& value) {
  return {std::move(key), encoder.encode(value)};
}

}  // namespace

namespace anchor::execution {

using anchor::storage::key_value_entry_t;

engine::engine(encoder_t& encoder, storage_t& storage, genesis_config genesis)
    : encoder_(encoder), storage_(storage), genesis_(std::move(genesis)) {
  auto lock = std::scoped_lock{mutex_};
  if (auto error = validate(genesis_)) {
    spdlog::error("Invalid genesis configuration: {}", *error);
    anchor::common::critical("invalid genesis configuration");
  }
  spdlog::info("Initializing {} chain {} execution engine",
               to_string(genesis_.role), genesis_.chain_id);

  load_persisted_state();
  spdlog::info("Execution engine ready at height {}", last_committed_height_);
}

chain_role_t engine::role() const {
  return genesis_.role;
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!maybe_tx) {
    return protocol::make_error(transaction_error_code::invalid_transaction,
                                protocol::kEngineCodespace,
                                "invalid transaction", decode_error);
  }
  return validate_transaction(*maybe_tx, protocol::kEngineCodespace);
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return protocol::make_error(
        transaction_error_code::unsupported_transaction_version, codespace,
        "unsupported transaction version", "expected version 1");
  }
  if (tx.chain_id != genesis_.chain_id) {
    return protocol::make_error(transaction_error_code::invalid_chain_id,
                                codespace, "wrong chain id",
                                std::to_string(tx.chain_id));
  }
  if (is_zero(tx.sender)) {
    return protocol::make_error(transaction_error_code::invalid_address,
                                codespace, "sender address is zero");
  }
  auto it = nonces_.find(tx.sender);
  auto expected = (it == std::end(nonces_) ? 0 : it->second) + 1;
  if (tx.nonce != expected) {
    return protocol::make_error(transaction_error_code::invalid_nonce,
                                codespace, "unexpected nonce",
                                "expected " + std::to_string(expected));
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(
    const transaction_t& tx,
    const protocol::call_context& context) {
  if (genesis_.role == chain_role_t::spoke) {
    if (tx.to == genesis_.spoke_address) {
      return execute_spoke_operation(tx, context);
    }
  } else {
    if (tx.to == genesis_.registry_address) {
      return execute_registry_operation(tx, context);
    }
    if (tx.to == genesis_.hub_address) {
      return execute_hub_operation(tx, context);
    }
    if (tx.to == genesis_.token_address) {
      return execute_token_operation(tx, context);
    }
  }
  return protocol::make_error(transaction_error_code::invalid_address,
                              protocol::kEngineCodespace,
                              "no unit deployed at address",
                              protocol::to_string(tx.to));
}

transaction_result_t engine::execute_registry_operation(
    const transaction_t& tx,
    const protocol::call_context& context) {
  auto& registry = *registry_;
  auto result = transaction_result_t{};
  std::visit(
      overloaded{
          [&](const verify_data_t& operation) {
            result = registry.verify_data(context, operation);
          },
          [&](const confirm_chain_verification_t& operation) {
            result = registry.confirm_chain_verification(context, operation);
          },
          [&](const confirm_chain_verification_batch_t& operation) {
            result =
                registry.confirm_chain_verification_batch(context, operation);
          },
          [&](const register_verifier_t& operation) {
            result = registry.register_verifier(context, operation);
          },
          [&](const set_verifier_active_t& operation) {
            result = registry.set_verifier_active(context, operation);
          },
          [&](const deposit_relayer_credits_t& operation) {
            result = registry.deposit_relayer_credits(context, operation);
          },
          [&](const allocate_user_credits_t& operation) {
            result = registry.allocate_user_credits(context, operation);
          },
          [&](const set_credit_payments_t& operation) {
            result = registry.set_credit_payments(context, operation);
          },
          [&](const set_relayer_t& operation) {
            result = registry.set_relayer(context, operation);
          },
          [&](const set_pause_t& operation) {
            result = registry.set_pause(context, operation);
          },
          [&](const schedule_change_t& operation) {
            result = registry.schedule_change(context, operation);
          },
          [&](const execute_change_t& operation) {
            result = registry.execute_change(context, operation);
          },
          [&](const auto&) { result = unsupported_operation("registry"); }},
      tx.payload);
  return result;
}

transaction_result_t engine::execute_hub_operation(
    const transaction_t& tx,
    const protocol::call_context& context) {
  auto& hub = *hub_;
  auto result = transaction_result_t{};
  std::visit(
      overloaded{
          [&](const create_voucher_t& operation) {
            result = hub.create_voucher(context, operation);
          },
          [&](const create_voucher_batch_t& operation) {
            result = hub.create_voucher_batch(context, operation);
          },
          [&](const confirm_voucher_fulfilled_t& operation) {
            result = hub.confirm_voucher_fulfilled(context, operation);
          },
          [&](const set_relayer_t& operation) {
            result = hub.set_relayer(context, operation);
          },
          [&](const set_pause_t& operation) {
            result = hub.set_pause(context, operation);
          },
          [&](const schedule_change_t& operation) {
            result = hub.schedule_change(context, operation);
          },
          [&](const execute_change_t& operation) {
            result = hub.execute_change(context, operation);
          },
          [&](const auto&) { result = unsupported_operation("hub"); }},
      tx.payload);
  return result;
}

transaction_result_t engine::execute_token_operation(
    const transaction_t& tx,
    const protocol::call_context& context) {
  auto& token = *token_;
  auto result = transaction_result_t{};
  std::visit(overloaded{[&](const token_approve_t& operation) {
                          result = token.approve(context, operation);
                        },
                        [&](const token_transfer_t& operation) {
                          result = token.transfer(context, operation);
                        },
                        [&](const auto&) {
                          result = unsupported_operation("token");
                        }},
             tx.payload);
  return result;
}

transaction_result_t engine::execute_spoke_operation(
    const transaction_t& tx,
    const protocol::call_context& context) {
  auto& spoke = *spoke_;
  auto result = transaction_result_t{};
  std::visit(
      overloaded{
          [&](const fulfill_voucher_batch_t& operation) {
            result = spoke.fulfill_voucher_batch(context, operation);
          },
          [&](const set_relayer_t& operation) {
            result = spoke.set_relayer(context, operation);
          },
          [&](const set_pause_t& operation) {
            result = spoke.set_pause(context, operation);
          },
          [&](const schedule_change_t& operation) {
            result = spoke.schedule_change(context, operation);
          },
          [&](const execute_change_t& operation) {
            result = spoke.execute_change(context, operation);
          },
          [&](const auto&) { result = unsupported_operation("spoke"); }},
      tx.payload);
  return result;
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const timestamp_seconds_t block_time,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  pending_history_.clear();

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto history_entry = history_entry_t{.height = height,
                                         .index = static_cast<uint32_t>(i),
                                         .code = 0,
                                         .tx = txs[i]};
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(
        encoder_, bytes_view_t{txs[i].data(), txs[i].size()}, decode_error);
    if (!maybe_tx) {
      auto tx_result = protocol::make_error(
          transaction_error_code::invalid_transaction,
          protocol::kEngineCodespace, "invalid transaction", decode_error);
      history_entry.code = tx_result.code;
      pending_history_.push_back(std::move(history_entry));
      result.tx_results.push_back(std::move(tx_result));
      continue;
    }

    auto tx_result =
        validate_transaction(*maybe_tx, protocol::kEngineCodespace);
    if (protocol::succeeded(tx_result)) {
      // The nonce is consumed whether or not the payload succeeds.
      nonces_[maybe_tx->sender] = maybe_tx->nonce;
      dirty_nonces_[maybe_tx->sender] = maybe_tx->nonce;
      auto context = protocol::call_context{.caller = maybe_tx->sender,
                                            .timestamp = block_time,
                                            .block_height = height};
      tx_result = execute_operation(*maybe_tx, context);
      rolling_root =
          fold_state_root(rolling_root, txs[i], height, i, tx_result.code);
    }
    if (!protocol::succeeded(tx_result)) {
      spdlog::debug("Transaction {} in block {} rejected: {} [{}:{}] {}", i,
                    height, tx_result.log, tx_result.codespace, tx_result.code,
                    tx_result.info);
    }
    history_entry.code = tx_result.code;
    pending_history_.push_back(std::move(history_entry));
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::info("Finalized block {} with {} transaction(s)", height,
               txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    auto entries = std::vector<key_value_entry_t>{};
    if (genesis_.role == chain_role_t::hub) {
      entries.push_back(make_entry(
          encoder_, key::make_registry_key(encoder_, genesis_.registry_address),
          registry_->state()));
      entries.push_back(make_entry(
          encoder_, key::make_hub_key(encoder_, genesis_.hub_address),
          hub_->state()));
      entries.push_back(make_entry(
          encoder_, key::make_token_key(encoder_, genesis_.token_address),
          token_->state()));
    } else {
      entries.push_back(make_entry(
          encoder_, key::make_spoke_key(encoder_, genesis_.spoke_address),
          spoke_->state()));
    }
    for (const auto& [sender, nonce] : dirty_nonces_) {
      entries.push_back(
          make_entry(encoder_, key::make_nonce_key(encoder_, sender), nonce));
    }
    for (const auto& entry : pending_history_) {
      entries.push_back(make_entry(
          encoder_, key::make_history_key(encoder_, entry.height, entry.index),
          entry));
    }
    storage_.write_batch(entries);

    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
    dirty_nonces_.clear();
    pending_history_.clear();
  }

  storage_.save_committed_state(anchor::storage::committed_state{
      .height = last_committed_height_,
      .state_root = last_committed_state_root_});
  spdlog::debug("Committed height {}", last_committed_height_);

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  return make_info();
}

app_info_t engine::make_info() const {
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.height = last_committed_height_;
  result.key = make_bytes(data);

  if (path == "/engine/info") {
    result.value = encoder_.encode(make_info());
    return result;
  }
  if (path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range || std::get<0>(*range) > std::get<1>(*range)) {
      return invalid_key(std::move(result), path);
    }
    result.value = encoder_.encode(
        load_history(std::get<0>(*range), std::get<1>(*range)));
    return result;
  }
  if (genesis_.role == chain_role_t::hub) {
    return query_hub_chain(path, data, std::move(result));
  }
  return query_spoke_chain(path, data, std::move(result));
}

query_result_t engine::query_hub_chain(const std::string_view path,
                                       const bytes_view_t& data,
                                       query_result_t result) {
  if (path == "/registry/verification") {
    auto q_hash = encoder_.try_decode<hash32_t>(data);
    if (!q_hash) {
      return invalid_key(std::move(result), path);
    }
    auto record = registry_->find_record(*q_hash);
    if (!record) {
      return not_found(std::move(result));
    }
    result.value = encoder_.encode(*record);
    return result;
  }
  if (path == "/registry/status") {
    auto q_hash = encoder_.try_decode<hash32_t>(data);
    if (!q_hash) {
      return invalid_key(std::move(result), path);
    }
    auto status = registry_->status(*q_hash);
    result.value = encoder_.encode(status);
    result.info = std::string{to_string(status)};
    return result;
  }
  if (path == "/registry/chain_confirmed") {
    auto key = encoder_.try_decode<std::tuple<hash32_t, chain_id_t>>(data);
    if (!key) {
      return invalid_key(std::move(result), path);
    }
    result.value = encoder_.encode(
        registry_->is_chain_confirmed(std::get<0>(*key), std::get<1>(*key)));
    return result;
  }
  if (path == "/registry/verifier") {
    auto verifier_id = encoder_.try_decode<hash32_t>(data);
    if (!verifier_id) {
      return invalid_key(std::move(result), path);
    }
    auto verifier = registry_->find_verifier(*verifier_id);
    if (!verifier) {
      return not_found(std::move(result));
    }
    result.value = encoder_.encode(*verifier);
    return result;
  }
  if (path == "/registry/relayer") {
    auto account = encoder_.try_decode<address_t>(data);
    if (!account) {
      return invalid_key(std::move(result), path);
    }
    result.value = encoder_.encode(registry_->is_relayer(*account));
    return result;
  }
  if (path == "/registry/credits") {
    auto key = encoder_.try_decode<std::tuple<address_t, address_t>>(data);
    if (!key) {
      return invalid_key(std::move(result), path);
    }
    result.value = encoder_.encode(
        std::tuple{registry_->relayer_credits(std::get<0>(*key)),
                   registry_->user_credits(std::get<0>(*key),
                                           std::get<1>(*key))});
    return result;
  }
  if (path == "/registry/nonce") {
    auto user = encoder_.try_decode<address_t>(data);
    if (!user) {
      return invalid_key(std::move(result), path);
    }
    result.value = encoder_.encode(registry_->nonce(*user));
    return result;
  }
  if (path == "/registry/fee_quote") {
    auto chain_count = encoder_.try_decode<uint32_t>(data);
    if (!chain_count) {
      return invalid_key(std::move(result), path);
    }
    auto fee = registry_->fee_quote(*chain_count);
    if (!fee) {
      return fail(std::move(result), query_error_code::invalid_key,
                  "fee overflows", std::to_string(*chain_count));
    }
    result.value = encoder_.encode(*fee);
    return result;
  }
  if (path == "/registry/config") {
    result.value = encoder_.encode(registry_->state().config);
    return result;
  }
  if (path == "/hub/voucher") {
    auto voucher_id = encoder_.try_decode<hash32_t>(data);
    if (!voucher_id) {
      return invalid_key(std::move(result), path);
    }
    auto voucher = hub_->find_voucher(*voucher_id);
    if (!voucher) {
      return not_found(std::move(result));
    }
    result.value = encoder_.encode(*voucher);
    return result;
  }
  if (path == "/hub/fulfilled") {
    auto key = encoder_.try_decode<std::tuple<hash32_t, chain_id_t>>(data);
    if (!key) {
      return invalid_key(std::move(result), path);
    }
    result.value = encoder_.encode(
        hub_->is_fulfilled(std::get<0>(*key), std::get<1>(*key)));
    return result;
  }
  if (path == "/hub/config") {
    result.value = encoder_.encode(hub_->state().config);
    return result;
  }
  if (path == "/token/balance") {
    auto owner = encoder_.try_decode<address_t>(data);
    if (!owner) {
      return invalid_key(std::move(result), path);
    }
    result.value = encoder_.encode(token_->balance_of(*owner));
    return result;
  }
  if (path == "/token/allowance") {
    auto key = encoder_.try_decode<std::tuple<address_t, address_t>>(data);
    if (!key) {
      return invalid_key(std::move(result), path);
    }
    result.value = encoder_.encode(
        token_->allowance(std::get<0>(*key), std::get<1>(*key)));
    return result;
  }
  return fail(std::move(result), query_error_code::unsupported_path,
              "unsupported query path", std::string{path});
}

query_result_t engine::query_spoke_chain(const std::string_view path,
                                         const bytes_view_t& data,
                                         query_result_t result) {
  if (path == "/spoke/fulfilled") {
    auto voucher_id = encoder_.try_decode<hash32_t>(data);
    if (!voucher_id) {
      return invalid_key(std::move(result), path);
    }
    result.value = encoder_.encode(spoke_->is_fulfilled(*voucher_id));
    return result;
  }
  if (path == "/spoke/anchor") {
    auto q_hash = encoder_.try_decode<hash32_t>(data);
    if (!q_hash) {
      return invalid_key(std::move(result), path);
    }
    auto voucher_id = spoke_->anchored_voucher(*q_hash);
    if (!voucher_id) {
      return not_found(std::move(result));
    }
    result.value = encoder_.encode(*voucher_id);
    return result;
  }
  if (path == "/spoke/batch") {
    auto batch_id = encoder_.try_decode<hash32_t>(data);
    if (!batch_id) {
      return invalid_key(std::move(result), path);
    }
    auto digest = spoke_->batch_digest(*batch_id);
    if (!digest) {
      return not_found(std::move(result));
    }
    result.value = encoder_.encode(*digest);
    return result;
  }
  if (path == "/spoke/config") {
    result.value = encoder_.encode(spoke_->state().config);
    return result;
  }
  return fail(std::move(result), query_error_code::unsupported_path,
              "unsupported query path", std::string{path});
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return load_history(from_height, to_height);
}

std::vector<history_entry_t> engine::load_history(
    const uint64_t from_height,
    const uint64_t to_height) const {
  auto entries = std::vector<history_entry_t>{};
  auto prefix = key::make_prefix_key(encoder_, key::kHistoryPrefix);
  for (const auto& [raw_key, raw_value] :
       storage_.list_by_prefix(bytes_view_t{prefix})) {
    auto entry = encoder_.try_decode<history_entry_t>(bytes_view_t{raw_value});
    if (!entry) {
      spdlog::warn("Skipping undecodable history row");
      continue;
    }
    if (entry->height < from_height || entry->height > to_height) {
      continue;
    }
    entries.push_back(std::move(*entry));
  }
  std::sort(std::begin(entries), std::end(entries),
            [](const history_entry_t& lhs, const history_entry_t& rhs) {
              return std::tie(lhs.height, lhs.index) <
                     std::tie(rhs.height, rhs.index);
            });
  return entries;
}

void engine::install_units(registry_state_t registry,
                           hub_state_t hub,
                           token_state_t token) {
  token_ = std::make_unique<protocol::token_ledger>(std::move(token));
  hub_ = std::make_unique<protocol::voucher_hub>(std::move(hub));
  registry_ = std::make_unique<protocol::verification_registry>(
      std::move(registry), *token_);
  registry_->set_voucher_hub_client(
      [this](const address_t& hub_address,
             const protocol::call_context& context,
             const create_voucher_t& operation) {
        if (!hub_ || hub_->state().config.self != hub_address) {
          return protocol::make_error(
              transaction_error_code::voucher_hub_unavailable,
              protocol::kEngineCodespace, "no voucher hub at address",
              protocol::to_string(hub_address));
        }
        return hub_->create_voucher(context, operation);
      });
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  auto committed = storage_.load_committed_state();
  if (!committed) {
    spdlog::info("No committed state found; starting from genesis");
    if (genesis_.role == chain_role_t::hub) {
      install_units(make_registry_state(genesis_), make_hub_state(genesis_),
                    make_token_state(genesis_));
    } else {
      spoke_ = std::make_unique<protocol::voucher_spoke>(
          make_spoke_state(genesis_));
    }
    return;
  }

  last_committed_height_ = committed->height;
  last_committed_state_root_ = committed->state_root;
  pending_state_root_ = committed->state_root;

  if (genesis_.role == chain_role_t::hub) {
    auto registry = storage_.get<registry_state_t>(
        encoder_, key::make_registry_key(encoder_, genesis_.registry_address));
    auto hub = storage_.get<hub_state_t>(
        encoder_, key::make_hub_key(encoder_, genesis_.hub_address));
    auto token = storage_.get<token_state_t>(
        encoder_, key::make_token_key(encoder_, genesis_.token_address));
    if (!registry || !hub || !token) {
      if (last_committed_height_ > 0) {
        anchor::common::critical("committed height without hub chain state");
      }
      install_units(make_registry_state(genesis_), make_hub_state(genesis_),
                    make_token_state(genesis_));
    } else {
      install_units(std::move(*registry), std::move(*hub), std::move(*token));
    }
  } else {
    auto spoke = storage_.get<spoke_state_t>(
        encoder_, key::make_spoke_key(encoder_, genesis_.spoke_address));
    if (!spoke && last_committed_height_ > 0) {
      anchor::common::critical("committed height without spoke state");
    }
    spoke_ = std::make_unique<protocol::voucher_spoke>(
        spoke ? std::move(*spoke) : make_spoke_state(genesis_));
  }

  auto prefix = key::make_prefix_key(encoder_, key::kNonceKeyPrefix);
  for (const auto& [raw_key, raw_value] :
       storage_.list_by_prefix(bytes_view_t{prefix})) {
    auto parsed =
        encoder_.try_decode<std::tuple<std::string, address_t>>(
            bytes_view_t{raw_key});
    auto nonce = encoder_.try_decode<uint64_t>(bytes_view_t{raw_value});
    if (!parsed || !nonce) {
      anchor::common::critical("failed to decode persisted sender nonce");
    }
    nonces_[std::get<1>(*parsed)] = *nonce;
  }
  spdlog::info("Restored {} sender nonce(s) at height {}", nonces_.size(),
               last_committed_height_);
}

}  // namespace anchor::execution
