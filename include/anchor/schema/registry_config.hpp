#pragma once
#include <anchor/schema/fee_schedule.hpp>
#include <anchor/schema/fee_split.hpp>
#include <anchor/schema/primitives.hpp>

// Schema type: registry config.
// Protocol workflow: Owner, collaborator wiring, fee policy and pause flags of
// the verification registry.
namespace anchor::schema {

template <uint16_t Version>
struct registry_config;

template <>
struct registry_config<1> final {
  uint16_t version{1};
  address_t owner{};
  address_t self{};
  address_t voucher_hub{};
  fee_schedule_t fees{};
  fee_split_t split{};
  bool credit_payments_enabled{};
  bool paused{};
  bool cross_chain_paused{};
};

using registry_config_t = registry_config<1>;

}  // namespace anchor::schema
