#pragma once
#include <anchor/protocol/call_context.hpp>
#include <anchor/schema/confirm_voucher_fulfilled.hpp>
#include <anchor/schema/create_voucher.hpp>
#include <anchor/schema/create_voucher_batch.hpp>
#include <anchor/schema/execute_change.hpp>
#include <anchor/schema/hub_state.hpp>
#include <anchor/schema/schedule_change.hpp>
#include <anchor/schema/set_pause.hpp>
#include <anchor/schema/set_relayer.hpp>
#include <anchor/schema/transaction_result.hpp>
#include <optional>

namespace anchor::protocol {

inline constexpr anchor::schema::duration_seconds_t kHubTimelockDelay =
    24 * 60 * 60;

/// hash(qHash, verifierId, timestamp, counter).
anchor::schema::hash32_t make_voucher_id(
    const anchor::schema::hash32_t& q_hash,
    const anchor::schema::hash32_t& verifier_id,
    anchor::schema::timestamp_seconds_t timestamp,
    uint64_t counter);

/// Voucher Hub.
///
/// Issues vouchers on behalf of the registry and records which target chains
/// relayers report as fulfilled. Hub-side fulfillment is strict: a second
/// confirmation for the same (voucher, chain) is rejected.
class voucher_hub final {
 public:
  explicit voucher_hub(anchor::schema::hub_state_t state);

  const anchor::schema::hub_state_t& state() const;

  anchor::schema::transaction_result_t create_voucher(
      const call_context& context,
      const anchor::schema::create_voucher_t& operation);

  /// Deprecated. One single-chain voucher per (qHash, chainId) pair.
  anchor::schema::transaction_result_t create_voucher_batch(
      const call_context& context,
      const anchor::schema::create_voucher_batch_t& operation);

  anchor::schema::transaction_result_t confirm_voucher_fulfilled(
      const call_context& context,
      const anchor::schema::confirm_voucher_fulfilled_t& operation);

  anchor::schema::transaction_result_t set_relayer(
      const call_context& context,
      const anchor::schema::set_relayer_t& operation);

  anchor::schema::transaction_result_t set_pause(
      const call_context& context,
      const anchor::schema::set_pause_t& operation);

  anchor::schema::transaction_result_t schedule_change(
      const call_context& context,
      const anchor::schema::schedule_change_t& operation);

  anchor::schema::transaction_result_t execute_change(
      const call_context& context,
      const anchor::schema::execute_change_t& operation);

  std::optional<anchor::schema::voucher_t> find_voucher(
      const anchor::schema::hash32_t& voucher_id) const;
  bool is_fulfilled(const anchor::schema::hash32_t& voucher_id,
                    anchor::schema::chain_id_t chain_id) const;

 private:
  std::optional<anchor::schema::transaction_result_t> check_creation(
      const call_context& context) const;

  void store_voucher(
      const call_context& context,
      const anchor::schema::hash32_t& voucher_id,
      const anchor::schema::hash32_t& q_hash,
      std::vector<anchor::schema::chain_id_t> target_chain_ids,
      const anchor::schema::hash32_t& verifier_id,
      anchor::schema::transaction_result_t& result);

  anchor::schema::hub_state_t state_;
};

}  // namespace anchor::protocol
