#pragma once
#include <anchor/schema/primitives.hpp>
#include <anchor/schema/verifier_info.hpp>
#include <map>

namespace anchor::schema {

template <uint16_t Version>
struct verifier_directory;

template <>
struct verifier_directory<1> final {
  uint16_t version{1};
  std::map<hash32_t, verifier_info_t> verifiers;
  uint64_t active_count{};
};

using verifier_directory_t = verifier_directory<1>;

}  // namespace anchor::schema
