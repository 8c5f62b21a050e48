#pragma once
#include <anchor/schema/primitives.hpp>

namespace anchor::schema {

template <uint16_t Version>
struct deposit_relayer_credits;

template <>
struct deposit_relayer_credits<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using deposit_relayer_credits_t = deposit_relayer_credits<1>;

}  // namespace anchor::schema
