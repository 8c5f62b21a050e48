#pragma once
#include <anchor/schema/primitives.hpp>
#include <string>

namespace anchor::schema {

template <uint16_t Version>
struct register_verifier;

template <>
struct register_verifier<1> final {
  uint16_t version{1};
  std::string verification_type;
};

using register_verifier_t = register_verifier<1>;

}  // namespace anchor::schema
