#pragma once
#include <anchor/schema/primitives.hpp>

// Schema type: set relayer.
// Protocol workflow: Owner adds (authorized = true) or removes a relayer on
// whichever unit the transaction targets.
namespace anchor::schema {

template <uint16_t Version>
struct set_relayer;

template <>
struct set_relayer<1> final {
  uint16_t version{1};
  address_t relayer{};
  bool authorized{};
};

using set_relayer_t = set_relayer<1>;

}  // namespace anchor::schema
