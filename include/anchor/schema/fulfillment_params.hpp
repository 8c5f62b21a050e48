#pragma once
#include <anchor/schema/primitives.hpp>

// Schema type: fulfillment params.
// Protocol workflow: One voucher descriptor inside a spoke batch, as observed
// by the relayer from the hub's voucher_created event.
namespace anchor::schema {

template <uint16_t Version>
struct fulfillment_params;

template <>
struct fulfillment_params<1> final {
  uint16_t version{1};
  hash32_t voucher_id{};
  hash32_t q_hash{};
  address_t verifier{};
  chain_id_t source_chain_id{};
  timestamp_seconds_t verified_at{};
};

using fulfillment_params_t = fulfillment_params<1>;

}  // namespace anchor::schema
