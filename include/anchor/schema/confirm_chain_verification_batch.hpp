#pragma once
#include <anchor/schema/primitives.hpp>
#include <vector>

// Schema type: confirm chain verification batch.
// Protocol workflow: Positional pairs (q_hashes[i], chain_ids[i]). One invalid
// element rejects the whole batch.
namespace anchor::schema {

template <uint16_t Version>
struct confirm_chain_verification_batch;

template <>
struct confirm_chain_verification_batch<1> final {
  uint16_t version{1};
  std::vector<hash32_t> q_hashes;
  std::vector<chain_id_t> chain_ids;
};

using confirm_chain_verification_batch_t = confirm_chain_verification_batch<1>;

}  // namespace anchor::schema
