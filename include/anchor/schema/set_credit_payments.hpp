#pragma once
#include <anchor/schema/primitives.hpp>

namespace anchor::schema {

template <uint16_t Version>
struct set_credit_payments;

template <>
struct set_credit_payments<1> final {
  uint16_t version{1};
  bool enabled{};
};

using set_credit_payments_t = set_credit_payments<1>;

}  // namespace anchor::schema
