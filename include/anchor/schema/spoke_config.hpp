#pragma once
#include <anchor/schema/primitives.hpp>

namespace anchor::schema {

template <uint16_t Version>
struct spoke_config;

template <>
struct spoke_config<1> final {
  uint16_t version{1};
  address_t owner{};
  address_t self{};
  address_t hub{};
  chain_id_t local_chain_id{};
  bool paused{};
};

using spoke_config_t = spoke_config<1>;

}  // namespace anchor::schema
