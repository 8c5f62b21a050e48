#pragma once
#include <anchor/schema/primitives.hpp>

namespace anchor::schema {

template <uint16_t Version>
struct set_verifier_active;

template <>
struct set_verifier_active<1> final {
  uint16_t version{1};
  hash32_t verifier_id{};
  bool active{};
};

using set_verifier_active_t = set_verifier_active<1>;

}  // namespace anchor::schema
