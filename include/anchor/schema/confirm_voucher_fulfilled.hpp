#pragma once
#include <anchor/schema/primitives.hpp>

namespace anchor::schema {

template <uint16_t Version>
struct confirm_voucher_fulfilled;

template <>
struct confirm_voucher_fulfilled<1> final {
  uint16_t version{1};
  hash32_t voucher_id{};
  hash32_t q_hash{};
  chain_id_t chain_id{};
};

using confirm_voucher_fulfilled_t = confirm_voucher_fulfilled<1>;

}  // namespace anchor::schema
