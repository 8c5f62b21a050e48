#pragma once
#include <anchor/schema/allocate_user_credits.hpp>
#include <anchor/schema/confirm_chain_verification.hpp>
#include <anchor/schema/confirm_chain_verification_batch.hpp>
#include <anchor/schema/confirm_voucher_fulfilled.hpp>
#include <anchor/schema/create_voucher.hpp>
#include <anchor/schema/create_voucher_batch.hpp>
#include <anchor/schema/deposit_relayer_credits.hpp>
#include <anchor/schema/execute_change.hpp>
#include <anchor/schema/fulfill_voucher_batch.hpp>
#include <anchor/schema/primitives.hpp>
#include <anchor/schema/register_verifier.hpp>
#include <anchor/schema/schedule_change.hpp>
#include <anchor/schema/set_credit_payments.hpp>
#include <anchor/schema/set_pause.hpp>
#include <anchor/schema/set_relayer.hpp>
#include <anchor/schema/set_verifier_active.hpp>
#include <anchor/schema/token_approve.hpp>
#include <anchor/schema/token_transfer.hpp>
#include <anchor/schema/verify_data.hpp>
#include <variant>

// Schema type: transaction.
// Protocol workflow: Envelope submitted to a chain. `to` names the unit
// (registry, hub, spoke or fee token) the payload is dispatched to.
namespace anchor::schema {

using transaction_payload_t = std::variant<verify_data_t,
                                           confirm_chain_verification_t,
                                           confirm_chain_verification_batch_t,
                                           register_verifier_t,
                                           set_verifier_active_t,
                                           deposit_relayer_credits_t,
                                           allocate_user_credits_t,
                                           set_credit_payments_t,
                                           set_relayer_t,
                                           schedule_change_t,
                                           execute_change_t,
                                           set_pause_t,
                                           create_voucher_t,
                                           create_voucher_batch_t,
                                           confirm_voucher_fulfilled_t,
                                           fulfill_voucher_batch_t,
                                           token_approve_t,
                                           token_transfer_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  chain_id_t chain_id{};
  uint64_t nonce{};
  address_t sender{};
  address_t to{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace anchor::schema
