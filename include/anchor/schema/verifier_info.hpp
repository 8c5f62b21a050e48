#pragma once
#include <anchor/schema/primitives.hpp>
#include <string>

namespace anchor::schema {

template <uint16_t Version>
struct verifier_info;

template <>
struct verifier_info<1> final {
  uint16_t version{1};
  std::string verification_type;
  bool active{};
  timestamp_seconds_t registered_at{};
};

using verifier_info_t = verifier_info<1>;

}  // namespace anchor::schema
