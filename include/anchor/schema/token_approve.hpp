#pragma once
#include <anchor/schema/primitives.hpp>

namespace anchor::schema {

template <uint16_t Version>
struct token_approve;

template <>
struct token_approve<1> final {
  uint16_t version{1};
  address_t spender{};
  amount_t amount{};
};

using token_approve_t = token_approve<1>;

}  // namespace anchor::schema
