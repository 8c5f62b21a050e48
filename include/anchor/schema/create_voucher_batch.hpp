#pragma once
#include <anchor/schema/primitives.hpp>
#include <vector>

// Schema type: create voucher batch.
// Protocol workflow: Deprecated bulk creation kept for older relayers. Each
// pair creates a voucher for a single target chain.
namespace anchor::schema {

template <uint16_t Version>
struct create_voucher_batch;

template <>
struct create_voucher_batch<1> final {
  uint16_t version{1};
  std::vector<hash32_t> q_hashes;
  std::vector<chain_id_t> chain_ids;
  hash32_t verifier_id{};
};

using create_voucher_batch_t = create_voucher_batch<1>;

}  // namespace anchor::schema
