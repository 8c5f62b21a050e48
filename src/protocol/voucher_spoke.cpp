#include <spdlog/spdlog.h>
#include <anchor/blake3/hash.hpp>
#include <anchor/protocol/relayers.hpp>
#include <anchor/protocol/result.hpp>
#include <anchor/protocol/timelock.hpp>
#include <anchor/protocol/voucher_spoke.hpp>
#include <anchor/schema/encoding/scale/encoder.hpp>
#include <utility>

using namespace anchor::schema;

namespace anchor::protocol {

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

transaction_result_t not_owner() {
  return make_error(transaction_error_code::not_owner, kSpokeCodespace,
                    "caller is not the owner");
}

}  // namespace

hash32_t make_batch_digest(const std::vector<fulfillment_params_t>& params) {
  auto encoded = encoder_t{}.encode(params);
  return anchor::blake3::hash(bytes_view_t{encoded});
}

voucher_spoke::voucher_spoke(spoke_state_t state) : state_(std::move(state)) {}

const spoke_state_t& voucher_spoke::state() const {
  return state_;
}

transaction_result_t voucher_spoke::fulfill_voucher_batch(
    const call_context& context,
    const fulfill_voucher_batch_t& operation) {
  if (!is_trusted_relayer(state_.relayers, context.caller)) {
    return make_error(transaction_error_code::not_trusted_relayer,
                      kSpokeCodespace, "caller is not a trusted relayer",
                      to_string(context.caller));
  }
  if (state_.config.paused) {
    return make_error(transaction_error_code::paused, kSpokeCodespace,
                      "spoke is paused");
  }
  if (operation.params.empty()) {
    return make_error(transaction_error_code::empty_batch, kSpokeCodespace,
                      "batch is empty", to_string(operation.batch_id));
  }
  if (operation.params.size() > kMaxFulfillmentBatch) {
    return make_error(transaction_error_code::batch_too_large,
                      kSpokeCodespace, "batch exceeds 100 entries",
                      std::to_string(operation.params.size()));
  }
  auto digest = make_batch_digest(operation.params);
  auto processed = state_.batches.find(operation.batch_id);
  if (processed != std::end(state_.batches)) {
    if (processed->second == digest) {
      return make_error(transaction_error_code::batch_already_processed,
                        kSpokeCodespace, "batch already processed",
                        to_string(operation.batch_id));
    }
    spdlog::warn("Batch {} resubmitted with different content",
                 to_string(operation.batch_id));
    return make_error(transaction_error_code::batch_content_mismatch,
                      kSpokeCodespace,
                      "batch id reused with different content",
                      to_string(operation.batch_id));
  }

  const auto chain_id = state_.config.local_chain_id;
  auto result = transaction_result_t{};
  auto fulfilled = size_t{0};
  auto skipped = size_t{0};
  auto failed = size_t{0};
  for (const auto& params : operation.params) {
    if (is_zero(params.voucher_id) || is_zero(params.q_hash)) {
      ++failed;
      continue;
    }
    auto& flag = state_.fulfilled[std::pair{params.voucher_id, chain_id}];
    if (flag) {
      ++skipped;
      continue;
    }
    flag = true;
    state_.anchors.try_emplace(params.q_hash, params.voucher_id);
    ++state_.fulfilled_count;
    ++fulfilled;
    append_event(result, "voucher_fulfilled",
                 {{"voucher_id", to_string(params.voucher_id)},
                  {"q_hash", to_string(params.q_hash)},
                  {"verifier", to_string(params.verifier)},
                  {"source_chain_id", std::to_string(params.source_chain_id)},
                  {"verified_at", std::to_string(params.verified_at)},
                  {"chain_id", std::to_string(chain_id)}});
  }
  state_.batches[operation.batch_id] = digest;

  spdlog::info("Spoke batch {}: {} fulfilled, {} skipped, {} failed",
               to_string(operation.batch_id), fulfilled, skipped, failed);
  append_event(result, "batch_processed",
               {{"batch_id", to_string(operation.batch_id)},
                {"total", std::to_string(operation.params.size())},
                {"fulfilled", std::to_string(fulfilled)},
                {"skipped", std::to_string(skipped)},
                {"failed", std::to_string(failed)},
                {"digest", to_string(digest)}});
  return result;
}

transaction_result_t voucher_spoke::set_relayer(const call_context& context,
                                                const set_relayer_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  return apply_set_relayer(state_.relayers, operation, kSpokeCodespace);
}

transaction_result_t voucher_spoke::set_pause(const call_context& context,
                                              const set_pause_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  if (operation.reason.empty()) {
    return make_error(transaction_error_code::empty_reason, kSpokeCodespace,
                      "pause reason is empty");
  }
  if (operation.scope != pause_scope_t::global) {
    return make_error(transaction_error_code::unsupported_operation,
                      kSpokeCodespace, "pause scope not supported",
                      std::string{to_string(operation.scope)});
  }
  if (state_.config.paused == operation.paused) {
    return make_error(operation.paused ? transaction_error_code::already_paused
                                       : transaction_error_code::not_paused,
                      kSpokeCodespace,
                      operation.paused ? "already paused" : "not paused");
  }
  state_.config.paused = operation.paused;

  spdlog::warn("Spoke pause set to {}: {}", operation.paused,
               operation.reason);
  auto result = transaction_result_t{};
  append_event(result, "pause_updated",
               {{"scope", std::string{to_string(operation.scope)}},
                {"paused", operation.paused ? "true" : "false"},
                {"reason", operation.reason}});
  return result;
}

transaction_result_t voucher_spoke::schedule_change(
    const call_context& context,
    const schedule_change_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  if (operation.action != timelock_action_t::set_hub) {
    return make_error(transaction_error_code::unsupported_action,
                      kSpokeCodespace, "action not supported by spoke",
                      std::string{to_string(operation.action)});
  }
  const auto* address = std::get_if<address_t>(&operation.value);
  if (address == nullptr) {
    return make_error(transaction_error_code::invalid_change_value,
                      kSpokeCodespace, "value does not match action",
                      std::string{to_string(operation.action)});
  }
  if (is_zero(*address)) {
    return make_error(transaction_error_code::invalid_address,
                      kSpokeCodespace, "address is zero");
  }
  return anchor::protocol::schedule_change(state_.timelock, operation,
                                           context.timestamp,
                                           kSpokeTimelockDelay,
                                           kSpokeCodespace);
}

transaction_result_t voucher_spoke::execute_change(
    const call_context& context,
    const execute_change_t& operation) {
  if (context.caller != state_.config.owner) {
    return not_owner();
  }
  return anchor::protocol::execute_change(
      state_.timelock, operation.action, context.timestamp, kSpokeCodespace,
      [&](const change_value_t& value, transaction_result_t& result) {
        append_event(result, "hub_update_recorded",
                     {{"current_hub", to_string(state_.config.hub)},
                      {"proposed_hub", to_string(std::get<address_t>(value))}});
      });
}

bool voucher_spoke::is_fulfilled(const hash32_t& voucher_id) const {
  auto it = state_.fulfilled.find(
      std::pair{voucher_id, state_.config.local_chain_id});
  return it != std::end(state_.fulfilled) && it->second;
}

std::optional<hash32_t> voucher_spoke::anchored_voucher(
    const hash32_t& q_hash) const {
  auto it = state_.anchors.find(q_hash);
  if (it == std::end(state_.anchors)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<hash32_t> voucher_spoke::batch_digest(
    const hash32_t& batch_id) const {
  auto it = state_.batches.find(batch_id);
  if (it == std::end(state_.batches)) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace anchor::protocol
