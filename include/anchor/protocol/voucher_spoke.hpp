#pragma once
#include <anchor/protocol/call_context.hpp>
#include <anchor/schema/execute_change.hpp>
#include <anchor/schema/fulfill_voucher_batch.hpp>
#include <anchor/schema/schedule_change.hpp>
#include <anchor/schema/set_pause.hpp>
#include <anchor/schema/set_relayer.hpp>
#include <anchor/schema/spoke_state.hpp>
#include <anchor/schema/transaction_result.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace anchor::protocol {

inline constexpr anchor::schema::duration_seconds_t kSpokeTimelockDelay =
    24 * 60 * 60;
inline constexpr std::size_t kMaxFulfillmentBatch = 100;

/// Content digest of a fulfillment batch.
anchor::schema::hash32_t make_batch_digest(
    const std::vector<anchor::schema::fulfillment_params_t>& params);

/// Voucher Spoke.
///
/// Marks hub vouchers as fulfilled on the local chain. Re-delivering an
/// already fulfilled voucher is skipped silently so competing relayers can
/// overlap; re-using a batch id is rejected.
class voucher_spoke final {
 public:
  explicit voucher_spoke(anchor::schema::spoke_state_t state);

  const anchor::schema::spoke_state_t& state() const;

  anchor::schema::transaction_result_t fulfill_voucher_batch(
      const call_context& context,
      const anchor::schema::fulfill_voucher_batch_t& operation);

  anchor::schema::transaction_result_t set_relayer(
      const call_context& context,
      const anchor::schema::set_relayer_t& operation);

  anchor::schema::transaction_result_t set_pause(
      const call_context& context,
      const anchor::schema::set_pause_t& operation);

  anchor::schema::transaction_result_t schedule_change(
      const call_context& context,
      const anchor::schema::schedule_change_t& operation);

  /// Hub rotation is recorded but not applied; the configured hub address is
  /// informational on a spoke.
  anchor::schema::transaction_result_t execute_change(
      const call_context& context,
      const anchor::schema::execute_change_t& operation);

  bool is_fulfilled(const anchor::schema::hash32_t& voucher_id) const;
  std::optional<anchor::schema::hash32_t> anchored_voucher(
      const anchor::schema::hash32_t& q_hash) const;
  std::optional<anchor::schema::hash32_t> batch_digest(
      const anchor::schema::hash32_t& batch_id) const;

 private:
  anchor::schema::spoke_state_t state_;
};

}  // namespace anchor::protocol
