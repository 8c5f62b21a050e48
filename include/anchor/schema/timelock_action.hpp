#pragma once

#include <anchor/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: timelock action.
// Protocol workflow: Sensitive configuration changes that must be scheduled
// and can only be applied after the owning unit's delay.
namespace anchor::schema {

enum class timelock_action_t : uint8_t {
  // registry
  set_voucher_hub = 0,
  set_fee_schedule = 1,
  set_treasury_split = 2,
  set_treasury_wallet = 3,
  set_burn_wallet = 4,
  // hub
  set_registry = 5,
  set_fee_collector = 6,
  set_voucher_fee = 7,
  // spoke
  set_hub = 8,
};

inline constexpr auto kTimelockActionMappings = std::array{
    std::pair<std::string_view, timelock_action_t>{
        "set_voucher_hub", timelock_action_t::set_voucher_hub},
    std::pair<std::string_view, timelock_action_t>{
        "set_fee_schedule", timelock_action_t::set_fee_schedule},
    std::pair<std::string_view, timelock_action_t>{
        "set_treasury_split", timelock_action_t::set_treasury_split},
    std::pair<std::string_view, timelock_action_t>{
        "set_treasury_wallet", timelock_action_t::set_treasury_wallet},
    std::pair<std::string_view, timelock_action_t>{
        "set_burn_wallet", timelock_action_t::set_burn_wallet},
    std::pair<std::string_view, timelock_action_t>{
        "set_registry", timelock_action_t::set_registry},
    std::pair<std::string_view, timelock_action_t>{
        "set_fee_collector", timelock_action_t::set_fee_collector},
    std::pair<std::string_view, timelock_action_t>{
        "set_voucher_fee", timelock_action_t::set_voucher_fee},
    std::pair<std::string_view, timelock_action_t>{"set_hub",
                                                   timelock_action_t::set_hub},
};

template <>
inline std::optional<timelock_action_t> try_from_string<timelock_action_t>(
    const std::string_view value) {
  return from_string(value, kTimelockActionMappings);
}

inline constexpr std::string_view to_string(const timelock_action_t value) {
  return name_of(value, kTimelockActionMappings);
}

}  // namespace anchor::schema
