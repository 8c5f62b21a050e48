#pragma once
#include <anchor/schema/fulfillment_params.hpp>
#include <anchor/schema/primitives.hpp>
#include <vector>

// Schema type: fulfill voucher batch.
// Protocol workflow: Relayer delivers hub vouchers to a spoke chain. Batch ids
// are single use; already fulfilled entries are skipped.
namespace anchor::schema {

template <uint16_t Version>
struct fulfill_voucher_batch;

template <>
struct fulfill_voucher_batch<1> final {
  uint16_t version{1};
  hash32_t batch_id{};
  std::vector<fulfillment_params_t> params;
};

using fulfill_voucher_batch_t = fulfill_voucher_batch<1>;

}  // namespace anchor::schema
