#include <spdlog/spdlog.h>
#include <anchor/blake3/hash.hpp>
#include <anchor/protocol/fees.hpp>
#include <anchor/protocol/relayers.hpp>
#include <anchor/protocol/result.hpp>
#include <anchor/protocol/timelock.hpp>
#include <anchor/protocol/verification_registry.hpp>
#include <anchor/schema/encoding/scale/encoder.hpp>
#include <limits>
#include <string>
#include <tuple>
#include <utility>

using namespace anchor::schema;

namespace anchor::protocol {

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

transaction_result_t not_owner() {
  return make_error(transaction_error_code::not_owner, kRegistryCodespace,
                    "caller is not the owner");
}

transaction_result_t registry_paused() {
  return make_error(transaction_error_code::paused, kRegistryCodespace,
                    "registry is paused");
}

// Ledger lookups used by both confirmation paths.
std::optional<transaction_result_t> check_confirmation_target(
    const registry_ledger_t& ledger,
    const hash32_t& q_hash,
    const chain_id_t chain_id) {
  if (!ledger.records.contains(q_hash)) {
    return make_error(transaction_error_code::verification_missing,
                      kRegistryCodespace, "qHash is not verified",
                      to_string(q_hash));
  }
  auto targets = ledger.targets.find(q_hash);
  if (targets == std::end(ledger.targets) ||
      !contains_chain(targets->second, chain_id)) {
    return make_error(transaction_error_code::chain_not_targeted,
                      kRegistryCodespace, "chain was not a target",
                      std::to_string(chain_id));
  }
  return std::nullopt;
}

bool is_confirmed(const registry_ledger_t& ledger,
                  const hash32_t& q_hash,
                  const chain_id_t chain_id) {
  auto it = ledger.confirmations.find(std::pair{q_hash, chain_id});
  return it != std::end(ledger.confirmations) && it->second;
}

}  // namespace

hash32_t make_verifier_id(const std::string_view verification_type) {
  return anchor::blake3::hash(verification_type);
}

hash32_t make_fallback_voucher_id(const hash32_t& q_hash,
                                  const address_t& user,
                                  const timestamp_seconds_t timestamp,
                                  const std::string_view failure) {
  auto encoder = encoder_t{};
  auto material =
      encoder.encode_all(q_hash, user, timestamp, std::string{failure});
  return anchor::blake3::hash(bytes_view_t{material});
}

verification_registry::verification_registry(registry_state_t state,
                                             token_ledger& token)
    : state_(std::move(state)), token_(token) {}

const registry_state_t& verification_registry::state() const {
  return state_;
}

void verification_registry::set_voucher_hub_client(
    voucher_hub_client_t client) {
  voucher_hub_client_ = std::move(client);
}

transaction_result_t verification_registry::verify_data(
    const call_context& context,
    const verify_data_t& operation) {
  auto reject = [&](const transaction_error_code code,
                    const std::string_view log, std::string info = {}) {
    spdlog::debug("verify_data rejected for {}: {}",
                  to_string(operation.q_hash), log);
    auto result = make_error(code, kRegistryCodespace, log, std::move(info));
    append_event(result, "verification_failed",
                 {{"q_hash", to_string(operation.q_hash)},
                  {"reason", std::string{log}}});
    return result;
  };

  const auto& config = state_.config;
  if (config.paused) {
    return reject(transaction_error_code::paused, "registry is paused");
  }
  if (!anchor::protocol::is_relayer(state_.relayers, context.caller)) {
    return reject(transaction_error_code::not_relayer,
                  "caller is not a relayer", to_string(context.caller));
  }
  if (is_zero(operation.user)) {
    return reject(transaction_error_code::invalid_address,
                  "user address is zero");
  }
  if (is_zero(operation.q_hash)) {
    return reject(transaction_error_code::invalid_q_hash, "qHash is zero");
  }
  if (state_.ledger.records.contains(operation.q_hash)) {
    return reject(transaction_error_code::already_verified,
                  "qHash already verified", to_string(operation.q_hash));
  }
  if (operation.proof_id.empty()) {
    return reject(transaction_error_code::empty_proof_id,
                  "proof id is empty");
  }
  if (!operation.target_chain_ids.empty() && config.cross_chain_paused) {
    return reject(transaction_error_code::cross_chain_paused,
                  "cross-chain propagation is paused");
  }
  if (!valid_target_chains(operation.target_chain_ids)) {
    return reject(transaction_error_code::invalid_target_chains,
                  "target chains must be non-zero and unique",
                  to_string(operation.target_chain_ids));
  }
  auto fee = total_fee(config.fees, operation.target_chain_ids.size());
  if (!fee.has_value()) {
    return reject(transaction_error_code::fee_overflow, "fee overflows",
                  std::to_string(operation.target_chain_ids.size()));
  }
  if (auto rejection =
          check_fee(context, operation.user, *fee, operation.q_hash)) {
    append_event(*rejection, "verification_failed",
                 {{"q_hash", to_string(operation.q_hash)},
                  {"reason", rejection->log}});
    return *rejection;
  }

  auto result = transaction_result_t{};
  collect_fee(context, operation.user, *fee, result);
  auto voucher_id = request_voucher(context, operation, result);

  auto& ledger = state_.ledger;
  auto& user_nonce = ledger.nonces[operation.user];
  ledger.records[operation.q_hash] = verification_record_t{
      .verifier = operation.user,
      .verified = true,
      .verified_at = context.timestamp,
      .block_height = context.block_height,
      .proof_id = operation.proof_id,
      .verification_type = operation.verification_type,
      .nonce = user_nonce};
  ledger.targets[operation.q_hash] = operation.target_chain_ids;
  ledger.vouchers[operation.q_hash] = voucher_id;
  ++user_nonce;
  ++ledger.verification_count;

  spdlog::info("Verified {} for {} with voucher {}",
               to_string(operation.q_hash), to_string(operation.user),
               to_string(voucher_id));
  append_event(result, "data_verified",
               {{"q_hash", to_string(operation.q_hash)},
                {"user", to_string(operation.user)},
                {"voucher_id", to_string(voucher_id)},
                {"proof_id", operation.proof_id},
                {"verification_type", operation.verification_type},
                {"target_chain_ids", to_string(operation.target_chain_ids)},
                {"fee", to_string(*fee)}});
  result.data = make_bytes(bytes_view_t{voucher_id});
  return result;
}

transaction_result_t verification_registry::confirm_chain_verification(
    const call_context& context,
    const confirm_chain_verification_t& operation) {
  if (state_.config.paused) {
    return registry_paused();
  }
  if (!is_trusted_relayer(state_.relayers, context.caller)) {
    return make_error(transaction_error_code::not_trusted_relayer,
                      kRegistryCodespace, "caller is not a trusted relayer",
                      to_string(context.caller));
  }
  if (auto rejection = check_confirmation_target(
          state_.ledger, operation.q_hash, operation.chain_id)) {
    return *rejection;
  }
  if (is_confirmed(state_.ledger, operation.q_hash, operation.chain_id)) {
    return make_error(transaction_error_code::chain_already_confirmed,
                      kRegistryCodespace, "chain already confirmed",
                      std::to_string(operation.chain_id));
  }

  state_.ledger.confirmations[std::pair{operation.q_hash, operation.chain_id}] =
      true;
  auto result = transaction_result_t{};
  append_event(result, "chain_verification_confirmed",
               {{"q_hash", to_string(operation.q_hash)},
                {"chain_id", std::to_string(operation.chain_id)}});
  return result;
}

transaction_result_t verification_registry::confirm_chain_verification_batch(
    const call_context& context,
    const confirm_chain_verification_batch_t& operation) {
  if (state_.config.paused) {
    return registry_paused();
  }
  if (!is_trusted_relayer(state_.relayers, context.caller)) {
    return make_error(transaction_error_code::not_trusted_relayer,
                      kRegistryCodespace, "caller is not a trusted relayer",
                      to_string(context.caller));
  }
  if (operation.q_hashes.size() != operation.chain_ids.size()) {
    return make_error(transaction_error_code::array_length_mismatch,
                      kRegistryCodespace, "array length mismatch");
  }
  if (operation.q_hashes.empty()) {
    return make_error(transaction_error_code::empty_batch, kRegistryCodespace,
                      "batch is empty");
  }
  for (size_t i = 0; i < operation.q_hashes.size(); ++i) {
    if (auto rejection = check_confirmation_target(
            state_.ledger, operation.q_hashes[i], operation.chain_ids[i])) {
      rejection->info = "index " + std::to_string(i) + ": " + rejection->info;
      return *rejection;
    }
  }

  auto result = transaction_result_t{};
  auto confirmed = size_t{0};
  for (size_t i = 0; i < operation.q_hashes.size(); ++i) {
    const auto& q_hash = operation.q_hashes[i];
    const auto chain_id = operation.chain_ids[i];
    if (is_confirmed(state_.ledger, q_hash, chain_id)) {
      continue;
    }
    state_.ledger.confirmations[std::pair{q_hash, chain_id}] = true;
    ++confirmed;
    append_event(result, "chain_verification_confirmed",
                 {{"q_hash", to_string(q_hash)},
                  {"chain_id", std::to_string(chain_id)}});
  }
  append_event(
      result, "chain_verification_batch_confirmed",
      {{"total", std::to_string(operation.q_hashes.size())},
       {"confirmed", std::to_string(confirmed)},
       {"skipped", std::to_string(operation.q_hashes.size() - confirmed)}});
  return result;
}

transaction_result_t verification_registry::set_relayer(
    const call_context& context,
    const set_relayer_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  return apply_set_relayer(state_.relayers, operation, kRegistryCodespace);
}

transaction_result_t verification_registry::register_verifier(
    const call_context& context,
    const register_verifier_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  if (operation.verification_type.empty()) {
    return make_error(transaction_error_code::empty_verification_type,
                      kRegistryCodespace, "verification type is empty");
  }
  auto verifier_id = make_verifier_id(operation.verification_type);
  auto& directory = state_.verifiers;
  if (directory.verifiers.contains(verifier_id)) {
    return make_error(transaction_error_code::verifier_exists,
                      kRegistryCodespace, "verifier already registered",
                      operation.verification_type);
  }
  directory.verifiers[verifier_id] =
      verifier_info_t{.verification_type = operation.verification_type,
                      .active = true,
                      .registered_at = context.timestamp};
  ++directory.active_count;

  auto result = transaction_result_t{};
  append_event(result, "verifier_registered",
               {{"verifier_id", to_string(verifier_id)},
                {"verification_type", operation.verification_type}});
  result.data = make_bytes(bytes_view_t{verifier_id});
  return result;
}

transaction_result_t verification_registry::set_verifier_active(
    const call_context& context,
    const set_verifier_active_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  auto& directory = state_.verifiers;
  auto it = directory.verifiers.find(operation.verifier_id);
  if (it == std::end(directory.verifiers)) {
    return make_error(transaction_error_code::verifier_missing,
                      kRegistryCodespace, "verifier not registered",
                      to_string(operation.verifier_id));
  }
  if (it->second.active == operation.active) {
    return make_error(operation.active
                          ? transaction_error_code::verifier_already_active
                          : transaction_error_code::verifier_already_inactive,
                      kRegistryCodespace,
                      operation.active ? "verifier already active"
                                       : "verifier already inactive",
                      to_string(operation.verifier_id));
  }
  it->second.active = operation.active;
  if (operation.active) {
    ++directory.active_count;
  } else {
    --directory.active_count;
  }

  auto result = transaction_result_t{};
  append_event(result,
               operation.active ? "verifier_reactivated"
                                : "verifier_deactivated",
               {{"verifier_id", to_string(operation.verifier_id)},
                {"active_count", std::to_string(directory.active_count)}});
  return result;
}

transaction_result_t verification_registry::deposit_relayer_credits(
    const call_context& context,
    const deposit_relayer_credits_t& operation) {
  if (state_.config.paused) {
    return registry_paused();
  }
  if (!anchor::protocol::is_relayer(state_.relayers, context.caller)) {
    return make_error(transaction_error_code::not_relayer, kRegistryCodespace,
                      "caller is not a relayer", to_string(context.caller));
  }
  if (operation.amount == 0) {
    return make_error(transaction_error_code::invalid_amount,
                      kRegistryCodespace, "deposit amount is zero");
  }
  const auto& self = state_.config.self;
  if (token_.allowance(context.caller, self) < operation.amount) {
    return make_error(transaction_error_code::insufficient_allowance,
                      kRegistryCodespace, "insufficient allowance",
                      to_string(context.caller));
  }
  if (!token_.can_move(context.caller, operation.amount)) {
    return make_error(transaction_error_code::insufficient_balance,
                      kRegistryCodespace, "insufficient balance",
                      to_string(context.caller));
  }
  auto pool = relayer_credits(context.caller);
  if (pool > std::numeric_limits<amount_t>::max() - operation.amount) {
    return make_error(transaction_error_code::amount_overflow,
                      kRegistryCodespace, "credit pool overflows");
  }

  auto result = transaction_result_t{};
  result.events.push_back(
      token_.move_from(self, context.caller, self, operation.amount));
  state_.credits.relayer_pools[context.caller] = pool + operation.amount;
  append_event(result, "relayer_credits_deposited",
               {{"relayer", to_string(context.caller)},
                {"amount", to_string(operation.amount)},
                {"pool", to_string(pool + operation.amount)}});
  return result;
}

transaction_result_t verification_registry::allocate_user_credits(
    const call_context& context,
    const allocate_user_credits_t& operation) {
  if (state_.config.paused) {
    return registry_paused();
  }
  if (!anchor::protocol::is_relayer(state_.relayers, context.caller)) {
    return make_error(transaction_error_code::not_relayer, kRegistryCodespace,
                      "caller is not a relayer", to_string(context.caller));
  }
  if (is_zero(operation.user)) {
    return make_error(transaction_error_code::invalid_address,
                      kRegistryCodespace, "user address is zero");
  }
  if (operation.amount == 0) {
    return make_error(transaction_error_code::invalid_amount,
                      kRegistryCodespace, "allocation amount is zero");
  }
  auto pool = relayer_credits(context.caller);
  if (pool < operation.amount) {
    return make_error(transaction_error_code::insufficient_credits,
                      kRegistryCodespace, "relayer pool too small",
                      to_string(pool));
  }
  auto allocation = user_credits(context.caller, operation.user);
  if (allocation > std::numeric_limits<amount_t>::max() - operation.amount) {
    return make_error(transaction_error_code::amount_overflow,
                      kRegistryCodespace, "user allocation overflows");
  }

  state_.credits.relayer_pools[context.caller] = pool - operation.amount;
  state_.credits.user_allocations[std::pair{context.caller, operation.user}] =
      allocation + operation.amount;
  auto result = transaction_result_t{};
  append_event(result, "user_credits_allocated",
               {{"relayer", to_string(context.caller)},
                {"user", to_string(operation.user)},
                {"amount", to_string(operation.amount)}});
  return result;
}

transaction_result_t verification_registry::set_credit_payments(
    const call_context& context,
    const set_credit_payments_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  state_.config.credit_payments_enabled = operation.enabled;
  auto result = transaction_result_t{};
  append_event(result, "credit_payments_updated",
               {{"enabled", operation.enabled ? "true" : "false"}});
  return result;
}

transaction_result_t verification_registry::set_pause(
    const call_context& context,
    const set_pause_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  if (operation.reason.empty()) {
    return make_error(transaction_error_code::empty_reason,
                      kRegistryCodespace, "pause reason is empty");
  }
  bool* flag = nullptr;
  switch (operation.scope) {
    case pause_scope_t::global:
      flag = &state_.config.paused;
      break;
    case pause_scope_t::cross_chain:
      flag = &state_.config.cross_chain_paused;
      break;
    default:
      return make_error(transaction_error_code::unsupported_operation,
                        kRegistryCodespace, "pause scope not supported",
                        std::string{to_string(operation.scope)});
  }
  if (*flag == operation.paused) {
    return make_error(operation.paused ? transaction_error_code::already_paused
                                       : transaction_error_code::not_paused,
                      kRegistryCodespace,
                      operation.paused ? "already paused" : "not paused",
                      std::string{to_string(operation.scope)});
  }
  *flag = operation.paused;

  spdlog::warn("Registry {} pause set to {}: {}", to_string(operation.scope),
               operation.paused, operation.reason);
  auto result = transaction_result_t{};
  append_event(result, "pause_updated",
               {{"scope", std::string{to_string(operation.scope)}},
                {"paused", operation.paused ? "true" : "false"},
                {"reason", operation.reason}});
  return result;
}

transaction_result_t verification_registry::schedule_change(
    const call_context& context,
    const schedule_change_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  auto invalid_value = [&]() {
    return make_error(transaction_error_code::invalid_change_value,
                      kRegistryCodespace, "value does not match action",
                      std::string{to_string(operation.action)});
  };
  switch (operation.action) {
    case timelock_action_t::set_voucher_hub:
    case timelock_action_t::set_treasury_wallet: {
      const auto* address = std::get_if<address_t>(&operation.value);
      if (address == nullptr) {
        return invalid_value();
      }
      if (is_zero(*address)) {
        return make_error(transaction_error_code::invalid_address,
                          kRegistryCodespace, "address is zero");
      }
      break;
    }
    case timelock_action_t::set_burn_wallet:
      // A zero address clears the burn wallet.
      if (!std::holds_alternative<address_t>(operation.value)) {
        return invalid_value();
      }
      break;
    case timelock_action_t::set_fee_schedule:
      if (!std::holds_alternative<fee_schedule_t>(operation.value)) {
        return invalid_value();
      }
      break;
    case timelock_action_t::set_treasury_split: {
      const auto* bps = std::get_if<uint16_t>(&operation.value);
      if (bps == nullptr) {
        return invalid_value();
      }
      if (*bps > kBasisPointsDenominator) {
        return make_error(transaction_error_code::invalid_basis_points,
                          kRegistryCodespace, "treasury bps above 10000",
                          std::to_string(*bps));
      }
      break;
    }
    default:
      return make_error(transaction_error_code::unsupported_action,
                        kRegistryCodespace, "action not supported by registry",
                        std::string{to_string(operation.action)});
  }
  return anchor::protocol::schedule_change(state_.timelock, operation,
                                           context.timestamp,
                                           kRegistryTimelockDelay,
                                           kRegistryCodespace);
}

transaction_result_t verification_registry::execute_change(
    const call_context& context,
    const execute_change_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  auto& config = state_.config;
  return anchor::protocol::execute_change(
      state_.timelock, operation.action, context.timestamp, kRegistryCodespace,
      [&](const change_value_t& value, transaction_result_t& result) {
        switch (operation.action) {
          case timelock_action_t::set_voucher_hub:
            config.voucher_hub = std::get<address_t>(value);
            append_event(result, "voucher_hub_updated",
                         {{"voucher_hub", to_string(config.voucher_hub)}});
            break;
          case timelock_action_t::set_fee_schedule:
            config.fees = std::get<fee_schedule_t>(value);
            append_event(
                result, "fees_updated",
                {{"verification_fee", to_string(config.fees.verification_fee)},
                 {"cross_chain_fee", to_string(config.fees.cross_chain_fee)}});
            break;
          case timelock_action_t::set_treasury_split:
            config.split.treasury_bps = std::get<uint16_t>(value);
            append_event(
                result, "treasury_split_updated",
                {{"treasury_bps", std::to_string(config.split.treasury_bps)},
                 {"burn_bps", std::to_string(kBasisPointsDenominator -
                                             config.split.treasury_bps)}});
            break;
          case timelock_action_t::set_treasury_wallet:
            config.split.treasury_wallet = std::get<address_t>(value);
            append_event(result, "treasury_wallet_updated",
                         {{"treasury_wallet",
                           to_string(config.split.treasury_wallet)}});
            break;
          case timelock_action_t::set_burn_wallet: {
            const auto& wallet = std::get<address_t>(value);
            if (is_zero(wallet)) {
              config.split.burn_wallet.reset();
            } else {
              config.split.burn_wallet = wallet;
            }
            append_event(
                result, "burn_wallet_updated",
                {{"burn_wallet", to_string(burn_destination(config.split))}});
            break;
          }
          default:
            break;
        }
      });
}

std::optional<verification_record_t> verification_registry::find_record(
    const hash32_t& q_hash) const {
  auto it = state_.ledger.records.find(q_hash);
  if (it == std::end(state_.ledger.records)) {
    return std::nullopt;
  }
  return it->second;
}

verification_status_t verification_registry::status(
    const hash32_t& q_hash) const {
  const auto& ledger = state_.ledger;
  if (!ledger.records.contains(q_hash)) {
    return verification_status_t::not_found;
  }
  // A record without targets never asked for propagation, so a fallback
  // voucher id does not make it a failure.
  auto targets = ledger.targets.find(q_hash);
  if (targets == std::end(ledger.targets) || targets->second.empty()) {
    return verification_status_t::verified;
  }
  if (ledger.fallback_vouchers.contains(q_hash)) {
    return verification_status_t::verified_propagation_failed;
  }
  auto confirmed = size_t{0};
  for (const auto chain_id : targets->second) {
    if (is_confirmed(ledger, q_hash, chain_id)) {
      ++confirmed;
    }
  }
  if (confirmed == 0) {
    return verification_status_t::verified_crosschain_initiated;
  }
  if (confirmed == targets->second.size()) {
    return verification_status_t::verified_crosschain_propagated;
  }
  return verification_status_t::verified_crosschain_propagating;
}

bool verification_registry::is_chain_confirmed(const hash32_t& q_hash,
                                               const chain_id_t chain_id) const {
  return is_confirmed(state_.ledger, q_hash, chain_id);
}

std::optional<hash32_t> verification_registry::voucher_for(
    const hash32_t& q_hash) const {
  auto it = state_.ledger.vouchers.find(q_hash);
  if (it == std::end(state_.ledger.vouchers)) {
    return std::nullopt;
  }
  return it->second;
}

bool verification_registry::is_fallback_voucher(const hash32_t& q_hash) const {
  return state_.ledger.fallback_vouchers.contains(q_hash);
}

std::optional<verifier_info_t> verification_registry::find_verifier(
    const hash32_t& verifier_id) const {
  auto it = state_.verifiers.verifiers.find(verifier_id);
  if (it == std::end(state_.verifiers.verifiers)) {
    return std::nullopt;
  }
  return it->second;
}

bool verification_registry::is_relayer(const address_t& account) const {
  return anchor::protocol::is_relayer(state_.relayers, account);
}

amount_t verification_registry::relayer_credits(
    const address_t& relayer) const {
  auto it = state_.credits.relayer_pools.find(relayer);
  return it == std::end(state_.credits.relayer_pools) ? amount_t{}
                                                      : it->second;
}

amount_t verification_registry::user_credits(const address_t& relayer,
                                             const address_t& user) const {
  auto it = state_.credits.user_allocations.find(std::pair{relayer, user});
  return it == std::end(state_.credits.user_allocations) ? amount_t{}
                                                         : it->second;
}

uint64_t verification_registry::nonce(const address_t& user) const {
  auto it = state_.ledger.nonces.find(user);
  return it == std::end(state_.ledger.nonces) ? 0 : it->second;
}

std::optional<amount_t> verification_registry::fee_quote(
    const std::size_t chain_count) const {
  return total_fee(state_.config.fees, chain_count);
}

bool verification_registry::credit_path_available(
    const call_context& context,
    const address_t& user,
    const amount_t& fee) const {
  return state_.config.credit_payments_enabled &&
         user_credits(context.caller, user) >= fee;
}

std::optional<transaction_result_t> verification_registry::check_fee(
    const call_context& context,
    const address_t& user,
    const amount_t& fee,
    const hash32_t& q_hash) const {
  if (fee == 0) {
    return std::nullopt;
  }
  const auto& self = state_.config.self;
  if (credit_path_available(context, user, fee)) {
    if (!token_.can_move(self, fee)) {
      return make_error(transaction_error_code::insufficient_balance,
                        kRegistryCodespace, "credit reserve is short",
                        to_string(q_hash));
    }
    return std::nullopt;
  }
  if (token_.allowance(user, self) < fee) {
    return make_error(transaction_error_code::insufficient_allowance,
                      kRegistryCodespace, "insufficient allowance",
                      to_string(user));
  }
  if (!token_.can_move(user, fee)) {
    return make_error(transaction_error_code::insufficient_balance,
                      kRegistryCodespace, "insufficient balance",
                      to_string(user));
  }
  return std::nullopt;
}

void verification_registry::collect_fee(const call_context& context,
                                        const address_t& user,
                                        const amount_t& fee,
                                        transaction_result_t& result) {
  if (fee == 0) {
    return;
  }
  const auto& config = state_.config;
  auto shares = split_fee(fee, config.split.treasury_bps);
  auto burn_wallet = burn_destination(config.split);
  auto credit = credit_path_available(context, user, fee);

  if (credit) {
    state_.credits.user_allocations[std::pair{context.caller, user}] -= fee;
    if (shares.treasury > 0) {
      result.events.push_back(token_.move(
          config.self, config.split.treasury_wallet, shares.treasury));
    }
    if (shares.burn > 0) {
      result.events.push_back(
          token_.move(config.self, burn_wallet, shares.burn));
    }
  } else {
    if (shares.treasury > 0) {
      result.events.push_back(token_.move_from(
          config.self, user, config.split.treasury_wallet, shares.treasury));
    }
    if (shares.burn > 0) {
      result.events.push_back(
          token_.move_from(config.self, user, burn_wallet, shares.burn));
    }
  }

  append_event(result, "fee_paid",
               {{"payer", to_string(user)},
                {"amount", to_string(fee)},
                {"treasury_share", to_string(shares.treasury)},
                {"burn_share", to_string(shares.burn)},
                {"path", credit ? "credit" : "direct"}});
}

hash32_t verification_registry::request_voucher(
    const call_context& context,
    const verify_data_t& operation,
    transaction_result_t& result) {
  const auto& config = state_.config;
  auto failure = std::string{};
  if (!voucher_hub_client_) {
    failure = "voucher hub client not installed";
  } else if (is_zero(config.voucher_hub)) {
    failure = "voucher hub not configured";
  } else {
    auto hub_context = call_context{.caller = config.self,
                                    .timestamp = context.timestamp,
                                    .block_height = context.block_height};
    auto hub_result = voucher_hub_client_(
        config.voucher_hub, hub_context,
        create_voucher_t{
            .q_hash = operation.q_hash,
            .target_chain_ids = operation.target_chain_ids,
            .verifier_id = make_verifier_id(operation.verification_type)});
    if (succeeded(hub_result) && hub_result.data.size() == hash32_t{}.size()) {
      append_events(result, hub_result.events);
      return make_hash32(hub_result.data);
    }
    failure = hub_result.codespace + ":" + std::to_string(hub_result.code) +
              " " + hub_result.log;
  }

  auto voucher_id = make_fallback_voucher_id(operation.q_hash, operation.user,
                                             context.timestamp, failure);
  state_.ledger.fallback_vouchers[operation.q_hash] = failure;
  spdlog::warn("Voucher hub unavailable for {} ({}); using fallback id {}",
               to_string(operation.q_hash), failure, to_string(voucher_id));
  append_event(result, "voucher_fallback",
               {{"q_hash", to_string(operation.q_hash)},
                {"voucher_id", to_string(voucher_id)},
                {"reason", failure}});
  return voucher_id;
}

}  // namespace anchor::protocol
