#pragma once
#include <anchor/schema/primitives.hpp>
#include <optional>

// Schema type: fee split.
// Protocol workflow: Treasury share in basis points; the remainder is burned.
// A missing burn wallet routes the burn share to kDeadAddress.
namespace anchor::schema {

template <uint16_t Version>
struct fee_split;

template <>
struct fee_split<1> final {
  uint16_t version{1};
  uint16_t treasury_bps{};
  address_t treasury_wallet{};
  std::optional<address_t> burn_wallet;
};

using fee_split_t = fee_split<1>;

}  // namespace anchor::schema
