#pragma once
#include <anchor/schema/primitives.hpp>

namespace anchor::schema {

template <uint16_t Version>
struct confirm_chain_verification;

template <>
struct confirm_chain_verification<1> final {
  uint16_t version{1};
  hash32_t q_hash{};
  chain_id_t chain_id{};
};

using confirm_chain_verification_t = confirm_chain_verification<1>;

}  // namespace anchor::schema
