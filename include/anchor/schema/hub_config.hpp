#pragma once
#include <anchor/schema/primitives.hpp>

// Schema type: hub config.
// Protocol workflow: Owner, registry binding, advertised voucher fee and
// pause flags of the voucher hub.
namespace anchor::schema {

template <uint16_t Version>
struct hub_config;

template <>
struct hub_config<1> final {
  uint16_t version{1};
  address_t owner{};
  address_t self{};
  address_t registry{};
  address_t fee_collector{};
  amount_t voucher_fee{};
  bool paused{};
  bool voucher_creation_paused{};
};

using hub_config_t = hub_config<1>;

}  // namespace anchor::schema
