#pragma once
#include <anchor/schema/primitives.hpp>
#include <cstdint>
#include <map>

// Schema type: relayer set.
// Protocol workflow: Bounded allow-list of off-chain operators. The relayer and
// trusted relayer maps are toggled together.
namespace anchor::schema {

inline constexpr uint32_t kMaxRelayers = 10;
inline constexpr uint32_t kMinRelayers = 1;

template <uint16_t Version>
struct relayer_set;

template <>
struct relayer_set<1> final {
  uint16_t version{1};
  std::map<address_t, bool> relayers;
  std::map<address_t, bool> trusted_relayers;
  uint32_t count{};
};

using relayer_set_t = relayer_set<1>;

}  // namespace anchor::schema
