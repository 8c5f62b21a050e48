#pragma once
#include <anchor/schema/primitives.hpp>
#include <vector>

// Schema type: create voucher.
// Protocol workflow: Registry-only request for a propagation intent on the
// hub. External senders are rejected.
namespace anchor::schema {

template <uint16_t Version>
struct create_voucher;

template <>
struct create_voucher<1> final {
  uint16_t version{1};
  hash32_t q_hash{};
  std::vector<chain_id_t> target_chain_ids;
  hash32_t verifier_id{};
};

using create_voucher_t = create_voucher<1>;

}  // namespace anchor::schema
