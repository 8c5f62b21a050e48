#pragma once
#include <anchor/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: verify data.
// Protocol workflow: Relayer submits a verified fact about a wallet. The
// registry charges the fee, records the qHash and asks the hub for a voucher.
namespace anchor::schema {

template <uint16_t Version>
struct verify_data;

template <>
struct verify_data<1> final {
  uint16_t version{1};
  address_t user{};
  hash32_t q_hash{};
  std::vector<chain_id_t> target_chain_ids;
  std::string proof_id;
  std::string verification_type;
};

using verify_data_t = verify_data<1>;

}  // namespace anchor::schema
