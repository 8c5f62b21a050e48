#pragma once
#include <anchor/schema/primitives.hpp>

namespace anchor::schema {

template <uint16_t Version>
struct token_transfer;

template <>
struct token_transfer<1> final {
  uint16_t version{1};
  address_t to{};
  amount_t amount{};
};

using token_transfer_t = token_transfer<1>;

}  // namespace anchor::schema
