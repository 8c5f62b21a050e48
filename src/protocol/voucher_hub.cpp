#include <spdlog/spdlog.h>
#include <anchor/blake3/hash.hpp>
#include <anchor/protocol/relayers.hpp>
#include <anchor/protocol/result.hpp>
#include <anchor/protocol/timelock.hpp>
#include <anchor/protocol/voucher_hub.hpp>
#include <anchor/schema/encoding/scale/encoder.hpp>
#include <set>
#include <tuple>
#include <utility>

using namespace anchor::schema;

namespace anchor::protocol {

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

transaction_result_t not_owner() {
  return make_error(transaction_error_code::not_owner, kHubCodespace,
                    "caller is not the owner");
}

}  // namespace

hash32_t make_voucher_id(const hash32_t& q_hash,
                         const hash32_t& verifier_id,
                         const timestamp_seconds_t timestamp,
                         const uint64_t counter) {
  auto encoder = encoder_t{};
  auto material =
      encoder.encode_all(q_hash, verifier_id, timestamp, counter);
  return anchor::blake3::hash(bytes_view_t{material});
}

voucher_hub::voucher_hub(hub_state_t state) : state_(std::move(state)) {}

const hub_state_t& voucher_hub::state() const {
  return state_;
}

std::optional<transaction_result_t> voucher_hub::check_creation(
    const call_context& context) const {
  const auto& config = state_.config;
  if (is_zero(config.registry) || context.caller != config.registry) {
    return make_error(transaction_error_code::not_registry, kHubCodespace,
                      "caller is not the registry", to_string(context.caller));
  }
  if (config.paused) {
    return make_error(transaction_error_code::paused, kHubCodespace,
                      "hub is paused");
  }
  if (config.voucher_creation_paused) {
    return make_error(transaction_error_code::voucher_creation_paused,
                      kHubCodespace, "voucher creation is paused");
  }
  return std::nullopt;
}

void voucher_hub::store_voucher(const call_context& context,
                                const hash32_t& voucher_id,
                                const hash32_t& q_hash,
                                std::vector<chain_id_t> target_chain_ids,
                                const hash32_t& verifier_id,
                                transaction_result_t& result) {
  auto voucher = voucher_t{.voucher_id = voucher_id,
                           .q_hash = q_hash,
                           .target_chain_ids = std::move(target_chain_ids),
                           .verifier_id = verifier_id,
                           .created_at = context.timestamp,
                           .active = true,
                           .creator = context.caller};
  append_event(result, "voucher_created",
               {{"voucher_id", to_string(voucher_id)},
                {"q_hash", to_string(q_hash)},
                {"verifier_id", to_string(verifier_id)},
                {"target_chain_ids", to_string(voucher.target_chain_ids)},
                {"created_at", std::to_string(context.timestamp)}});
  state_.vouchers[voucher_id] = std::move(voucher);
  ++state_.voucher_counter;
}

transaction_result_t voucher_hub::create_voucher(
    const call_context& context,
    const create_voucher_t& operation) {
  if (auto rejection = check_creation(context)) {
    return *rejection;
  }
  if (is_zero(operation.q_hash)) {
    return make_error(transaction_error_code::invalid_q_hash, kHubCodespace,
                      "qHash is zero");
  }
  if (!valid_target_chains(operation.target_chain_ids)) {
    return make_error(transaction_error_code::invalid_target_chains,
                      kHubCodespace, "target chains must be non-zero and unique",
                      to_string(operation.target_chain_ids));
  }
  auto voucher_id = make_voucher_id(operation.q_hash, operation.verifier_id,
                                    context.timestamp, state_.voucher_counter);
  if (state_.vouchers.contains(voucher_id)) {
    return make_error(transaction_error_code::voucher_exists, kHubCodespace,
                      "voucher already exists", to_string(voucher_id));
  }

  auto result = transaction_result_t{};
  store_voucher(context, voucher_id, operation.q_hash,
                operation.target_chain_ids, operation.verifier_id, result);
  spdlog::info("Hub created voucher {} for {} ({} chain(s))",
               to_string(voucher_id), to_string(operation.q_hash),
               operation.target_chain_ids.size());
  result.data = make_bytes(bytes_view_t{voucher_id});
  return result;
}

transaction_result_t voucher_hub::create_voucher_batch(
    const call_context& context,
    const create_voucher_batch_t& operation) {
  if (auto rejection = check_creation(context)) {
    return *rejection;
  }
  if (operation.q_hashes.size() != operation.chain_ids.size()) {
    return make_error(transaction_error_code::array_length_mismatch,
                      kHubCodespace, "array length mismatch");
  }
  if (operation.q_hashes.empty()) {
    return make_error(transaction_error_code::empty_batch, kHubCodespace,
                      "batch is empty");
  }

  // Derive every id before the first write so a collision rejects the batch.
  auto voucher_ids = std::vector<hash32_t>{};
  voucher_ids.reserve(operation.q_hashes.size());
  auto seen = std::set<hash32_t>{};
  for (size_t i = 0; i < operation.q_hashes.size(); ++i) {
    if (is_zero(operation.q_hashes[i])) {
      return make_error(transaction_error_code::invalid_q_hash, kHubCodespace,
                        "qHash is zero", "index " + std::to_string(i));
    }
    if (operation.chain_ids[i] == 0) {
      return make_error(transaction_error_code::invalid_target_chains,
                        kHubCodespace, "chain id is zero",
                        "index " + std::to_string(i));
    }
    auto voucher_id =
        make_voucher_id(operation.q_hashes[i], operation.verifier_id,
                        context.timestamp, state_.voucher_counter + i);
    if (state_.vouchers.contains(voucher_id) ||
        !seen.insert(voucher_id).second) {
      return make_error(transaction_error_code::voucher_exists, kHubCodespace,
                        "voucher already exists", to_string(voucher_id));
    }
    voucher_ids.push_back(voucher_id);
  }

  auto result = transaction_result_t{};
  for (size_t i = 0; i < voucher_ids.size(); ++i) {
    store_voucher(context, voucher_ids[i], operation.q_hashes[i],
                  {operation.chain_ids[i]}, operation.verifier_id, result);
  }
  result.data = encoder_t{}.encode(voucher_ids);
  return result;
}

transaction_result_t voucher_hub::confirm_voucher_fulfilled(
    const call_context& context,
    const confirm_voucher_fulfilled_t& operation) {
  if (context.caller != state_.config.owner &&
      !is_trusted_relayer(state_.relayers, context.caller)) {
    return make_error(transaction_error_code::not_trusted_relayer,
                      kHubCodespace, "caller is not a trusted relayer",
                      to_string(context.caller));
  }
  if (state_.config.paused) {
    return make_error(transaction_error_code::paused, kHubCodespace,
                      "hub is paused");
  }
  auto voucher = state_.vouchers.find(operation.voucher_id);
  if (voucher == std::end(state_.vouchers)) {
    return make_error(transaction_error_code::voucher_missing, kHubCodespace,
                      "voucher does not exist", to_string(operation.voucher_id));
  }
  if (voucher->second.q_hash != operation.q_hash) {
    return make_error(transaction_error_code::voucher_hash_mismatch,
                      kHubCodespace, "qHash does not match voucher",
                      to_string(operation.q_hash));
  }
  if (!contains_chain(voucher->second.target_chain_ids, operation.chain_id)) {
    return make_error(transaction_error_code::chain_not_targeted,
                      kHubCodespace, "chain was not a target",
                      std::to_string(operation.chain_id));
  }
  if (is_fulfilled(operation.voucher_id, operation.chain_id)) {
    return make_error(transaction_error_code::already_fulfilled, kHubCodespace,
                      "voucher already fulfilled on chain",
                      std::to_string(operation.chain_id));
  }

  state_.fulfilled[std::pair{operation.voucher_id, operation.chain_id}] = true;
  auto result = transaction_result_t{};
  append_event(result, "voucher_fulfilled_on_hub",
               {{"voucher_id", to_string(operation.voucher_id)},
                {"q_hash", to_string(operation.q_hash)},
                {"chain_id", std::to_string(operation.chain_id)}});
  return result;
}

transaction_result_t voucher_hub::set_relayer(const call_context& context,
                                              const set_relayer_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  return apply_set_relayer(state_.relayers, operation, kHubCodespace);
}

transaction_result_t voucher_hub::set_pause(const call_context& context,
                                            const set_pause_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  if (operation.reason.empty()) {
    return make_error(transaction_error_code::empty_reason, kHubCodespace,
                      "pause reason is empty");
  }
  bool* flag = nullptr;
  switch (operation.scope) {
    case pause_scope_t::global:
      flag = &state_.config.paused;
      break;
    case pause_scope_t::voucher_creation:
      flag = &state_.config.voucher_creation_paused;
      break;
    default:
      return make_error(transaction_error_code::unsupported_operation,
                        kHubCodespace, "pause scope not supported",
                        std::string{to_string(operation.scope)});
  }
  if (*flag == operation.paused) {
    return make_error(operation.paused ? transaction_error_code::already_paused
                                       : transaction_error_code::not_paused,
                      kHubCodespace,
                      operation.paused ? "already paused" : "not paused",
                      std::string{to_string(operation.scope)});
  }
  *flag = operation.paused;

  spdlog::warn("Hub {} pause set to {}: {}", to_string(operation.scope),
               operation.paused, operation.reason);
  auto result = transaction_result_t{};
  append_event(result, "pause_updated",
               {{"scope", std::string{to_string(operation.scope)}},
                {"paused", operation.paused ? "true" : "false"},
                {"reason", operation.reason}});
  return result;
}

transaction_result_t voucher_hub::schedule_change(
    const call_context& context,
    const schedule_change_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  switch (operation.action) {
    case timelock_action_t::set_registry:
    case timelock_action_t::set_fee_collector: {
      const auto* address = std::get_if<address_t>(&operation.value);
      if (address == nullptr) {
        return make_error(transaction_error_code::invalid_change_value,
                          kHubCodespace, "value does not match action",
                          std::string{to_string(operation.action)});
      }
      if (is_zero(*address)) {
        return make_error(transaction_error_code::invalid_address,
                          kHubCodespace, "address is zero");
      }
      break;
    }
    case timelock_action_t::set_voucher_fee:
      if (!std::holds_alternative<amount_t>(operation.value)) {
        return make_error(transaction_error_code::invalid_change_value,
                          kHubCodespace, "value does not match action",
                          std::string{to_string(operation.action)});
      }
      break;
    default:
      return make_error(transaction_error_code::unsupported_action,
                        kHubCodespace, "action not supported by hub",
                        std::string{to_string(operation.action)});
  }
  return anchor::protocol::schedule_change(state_.timelock, operation,
                                           context.timestamp,
                                           kHubTimelockDelay, kHubCodespace);
}

transaction_result_t voucher_hub::execute_change(
    const call_context& context,
    const execute_change_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  auto& config = state_.config;
  return anchor::protocol::execute_change(
      state_.timelock, operation.action, context.timestamp, kHubCodespace,
      [&](const change_value_t& value, transaction_result_t& result) {
        switch (operation.action) {
          case timelock_action_t::set_registry:
            config.registry = std::get<address_t>(value);
            append_event(result, "registry_updated",
                         {{"registry", to_string(config.registry)}});
            break;
          case timelock_action_t::set_fee_collector:
            config.fee_collector = std::get<address_t>(value);
            append_event(result, "fee_collector_updated",
                         {{"fee_collector", to_string(config.fee_collector)}});
            break;
          case timelock_action_t::set_voucher_fee:
            config.voucher_fee = std::get<amount_t>(value);
            append_event(result, "voucher_fee_updated",
                         {{"voucher_fee", to_string(config.voucher_fee)}});
            break;
          default:
            break;
        }
      });
}

std::optional<voucher_t> voucher_hub::find_voucher(
    const hash32_t& voucher_id) const {
  auto it = state_.vouchers.find(voucher_id);
  if (it == std::end(state_.vouchers)) {
    return std::nullopt;
  }
  return it->second;
}

bool voucher_hub::is_fulfilled(const hash32_t& voucher_id,
                               const chain_id_t chain_id) const {
  auto it = state_.fulfilled.find(std::pair{voucher_id, chain_id});
  return it != std::end(state_.fulfilled) && it->second;
}

}  // namespace anchor::protocol
