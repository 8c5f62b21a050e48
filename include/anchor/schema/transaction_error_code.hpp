#pragma once

#include <cstdint>

// Schema type: transaction error code.
// Protocol workflow: Rejection taxonomy shared by every unit. Codes are stable
// so indexers and relayers can tell "already done" from "must fix and retry".
namespace anchor::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  unsupported_operation = 5,

  // authorization
  not_owner = 10,
  not_relayer = 11,
  not_trusted_relayer = 12,
  not_registry = 13,

  // validation
  invalid_address = 20,
  invalid_q_hash = 21,
  empty_proof_id = 22,
  invalid_target_chains = 23,
  empty_verification_type = 24,
  array_length_mismatch = 25,
  empty_batch = 26,
  batch_too_large = 27,
  invalid_amount = 28,
  invalid_basis_points = 29,
  invalid_change_value = 30,
  empty_reason = 31,

  // state
  already_verified = 40,
  verification_missing = 41,
  chain_not_targeted = 42,
  chain_already_confirmed = 43,
  voucher_exists = 44,
  voucher_missing = 45,
  voucher_hash_mismatch = 46,
  already_fulfilled = 47,
  batch_already_processed = 48,
  batch_content_mismatch = 49,
  verifier_exists = 50,
  verifier_missing = 51,
  verifier_already_active = 52,
  verifier_already_inactive = 53,
  relayer_exists = 54,
  relayer_missing = 55,
  relayer_limit_reached = 56,
  last_relayer = 57,
  proposal_unknown = 58,
  timelock_not_expired = 59,
  unsupported_action = 60,
  paused = 61,
  voucher_creation_paused = 62,
  cross_chain_paused = 63,
  already_paused = 64,
  not_paused = 65,

  // resource
  insufficient_allowance = 70,
  insufficient_balance = 71,
  insufficient_credits = 72,
  fee_overflow = 73,
  amount_overflow = 74,

  // collaborator
  voucher_hub_unavailable = 80,
};

}  // namespace anchor::schema
