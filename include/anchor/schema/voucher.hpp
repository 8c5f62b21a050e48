#pragma once
#include <anchor/schema/primitives.hpp>
#include <vector>

// Schema type: voucher.
// Protocol workflow: Propagation intent naming the chains that should learn a
// qHash was verified. The target list is fixed at creation.
namespace anchor::schema {

template <uint16_t Version>
struct voucher;

template <>
struct voucher<1> final {
  uint16_t version{1};
  hash32_t voucher_id{};
  hash32_t q_hash{};
  std::vector<chain_id_t> target_chain_ids;
  hash32_t verifier_id{};
  timestamp_seconds_t created_at{};
  bool active{true};
  address_t creator{};
};

using voucher_t = voucher<1>;

}  // namespace anchor::schema
