#pragma once
#include <anchor/protocol/call_context.hpp>
#include <anchor/protocol/token_ledger.hpp>
#include <anchor/schema/allocate_user_credits.hpp>
#include <anchor/schema/confirm_chain_verification.hpp>
#include <anchor/schema/confirm_chain_verification_batch.hpp>
#include <anchor/schema/create_voucher.hpp>
#include <anchor/schema/deposit_relayer_credits.hpp>
#include <anchor/schema/execute_change.hpp>
#include <anchor/schema/register_verifier.hpp>
#include <anchor/schema/registry_state.hpp>
#include <anchor/schema/schedule_change.hpp>
#include <anchor/schema/set_credit_payments.hpp>
#include <anchor/schema/set_pause.hpp>
#include <anchor/schema/set_relayer.hpp>
#include <anchor/schema/set_verifier_active.hpp>
#include <anchor/schema/transaction_result.hpp>
#include <anchor/schema/verification_status.hpp>
#include <anchor/schema/verify_data.hpp>
#include <functional>
#include <optional>
#include <string_view>

namespace anchor::protocol {

inline constexpr anchor::schema::duration_seconds_t kRegistryTimelockDelay =
    2 * 24 * 60 * 60;

/// Call into the voucher hub deployed at `hub`. The context carries the
/// registry as caller.
using voucher_hub_client_t = std::function<anchor::schema::transaction_result_t(
    const anchor::schema::address_t& hub,
    const call_context& context,
    const anchor::schema::create_voucher_t& operation)>;

/// verifierId for a verification type string.
anchor::schema::hash32_t make_verifier_id(std::string_view verification_type);

/// Deterministic stand-in voucher id used when the hub cannot issue one.
anchor::schema::hash32_t make_fallback_voucher_id(
    const anchor::schema::hash32_t& q_hash,
    const anchor::schema::address_t& user,
    anchor::schema::timestamp_seconds_t timestamp,
    std::string_view failure);

/// Verification Registry.
///
/// Records one immutable verification per qHash, collects the split fee
/// through the token ledger, asks the hub for a voucher and tracks which
/// target chains have confirmed the fact. Every entry point validates fully
/// before its first effect, so a rejected call leaves state untouched.
class verification_registry final {
 public:
  verification_registry(anchor::schema::registry_state_t state,
                        token_ledger& token);

  const anchor::schema::registry_state_t& state() const;

  /// Install the hub collaborator. Without one every voucher request falls
  /// back to a locally derived id.
  void set_voucher_hub_client(voucher_hub_client_t client);

  anchor::schema::transaction_result_t verify_data(
      const call_context& context,
      const anchor::schema::verify_data_t& operation);

  anchor::schema::transaction_result_t confirm_chain_verification(
      const call_context& context,
      const anchor::schema::confirm_chain_verification_t& operation);

  anchor::schema::transaction_result_t confirm_chain_verification_batch(
      const call_context& context,
      const anchor::schema::confirm_chain_verification_batch_t& operation);

  anchor::schema::transaction_result_t set_relayer(
      const call_context& context,
      const anchor::schema::set_relayer_t& operation);

  anchor::schema::transaction_result_t register_verifier(
      const call_context& context,
      const anchor::schema::register_verifier_t& operation);

  anchor::schema::transaction_result_t set_verifier_active(
      const call_context& context,
      const anchor::schema::set_verifier_active_t& operation);

  anchor::schema::transaction_result_t deposit_relayer_credits(
      const call_context& context,
      const anchor::schema::deposit_relayer_credits_t& operation);

  anchor::schema::transaction_result_t allocate_user_credits(
      const call_context& context,
      const anchor::schema::allocate_user_credits_t& operation);

  anchor::schema::transaction_result_t set_credit_payments(
      const call_context& context,
      const anchor::schema::set_credit_payments_t& operation);

  anchor::schema::transaction_result_t set_pause(
      const call_context& context,
      const anchor::schema::set_pause_t& operation);

  anchor::schema::transaction_result_t schedule_change(
      const call_context& context,
      const anchor::schema::schedule_change_t& operation);

  anchor::schema::transaction_result_t execute_change(
      const call_context& context,
      const anchor::schema::execute_change_t& operation);

  std::optional<anchor::schema::verification_record_t> find_record(
      const anchor::schema::hash32_t& q_hash) const;
  anchor::schema::verification_status_t status(
      const anchor::schema::hash32_t& q_hash) const;
  bool is_chain_confirmed(const anchor::schema::hash32_t& q_hash,
                          anchor::schema::chain_id_t chain_id) const;
  std::optional<anchor::schema::hash32_t> voucher_for(
      const anchor::schema::hash32_t& q_hash) const;
  bool is_fallback_voucher(const anchor::schema::hash32_t& q_hash) const;
  std::optional<anchor::schema::verifier_info_t> find_verifier(
      const anchor::schema::hash32_t& verifier_id) const;
  bool is_relayer(const anchor::schema::address_t& account) const;
  anchor::schema::amount_t relayer_credits(
      const anchor::schema::address_t& relayer) const;
  anchor::schema::amount_t user_credits(
      const anchor::schema::address_t& relayer,
      const anchor::schema::address_t& user) const;
  uint64_t nonce(const anchor::schema::address_t& user) const;
  std::optional<anchor::schema::amount_t> fee_quote(
      std::size_t chain_count) const;

 private:
  /// Validate that the fee can be collected from the credit slice or the
  /// user's allowance; returns the rejection when neither path covers it.
  std::optional<anchor::schema::transaction_result_t> check_fee(
      const call_context& context,
      const anchor::schema::address_t& user,
      const anchor::schema::amount_t& fee,
      const anchor::schema::hash32_t& q_hash) const;

  /// Collect a fee that check_fee accepted.
  void collect_fee(const call_context& context,
                   const anchor::schema::address_t& user,
                   const anchor::schema::amount_t& fee,
                   anchor::schema::transaction_result_t& result);

  /// Ask the hub for a voucher, substituting the fallback id on failure.
  anchor::schema::hash32_t request_voucher(
      const call_context& context,
      const anchor::schema::verify_data_t& operation,
      anchor::schema::transaction_result_t& result);

  bool credit_path_available(const call_context& context,
                             const anchor::schema::address_t& user,
                             const anchor::schema::amount_t& fee) const;

  anchor::schema::registry_state_t state_;
  token_ledger& token_;
  voucher_hub_client_t voucher_hub_client_;
};

}  // namespace anchor::protocol
