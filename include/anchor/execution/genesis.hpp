#pragma once
#include <anchor/schema/enum_string.hpp>
#include <anchor/schema/fee_schedule.hpp>
#include <anchor/schema/hub_state.hpp>
#include <anchor/schema/primitives.hpp>
#include <anchor/schema/registry_state.hpp>
#include <anchor/schema/spoke_state.hpp>
#include <anchor/schema/token_state.hpp>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace anchor::execution {

/// Which units a chain hosts. The hub chain runs registry, hub and fee token;
/// every target chain runs one spoke.
enum class chain_role_t : uint8_t { hub = 0, spoke = 1 };

inline constexpr auto kChainRoleMappings = std::array{
    std::pair<std::string_view, chain_role_t>{"hub", chain_role_t::hub},
    std::pair<std::string_view, chain_role_t>{"spoke", chain_role_t::spoke},
};

inline constexpr std::string_view to_string(const chain_role_t value) {
  return anchor::schema::name_of(value, kChainRoleMappings);
}

/// Initial deployment parameters for one chain.
struct genesis_config final {
  chain_role_t role{chain_role_t::hub};
  anchor::schema::chain_id_t chain_id{};
  anchor::schema::address_t owner{};
  std::vector<anchor::schema::address_t> relayers;

  anchor::schema::address_t registry_address{};
  anchor::schema::address_t hub_address{};
  anchor::schema::address_t token_address{};
  anchor::schema::address_t spoke_address{};

  anchor::schema::fee_schedule_t fees{};
  uint16_t treasury_bps{};
  anchor::schema::address_t treasury_wallet{};
  std::optional<anchor::schema::address_t> burn_wallet;
  bool credit_payments_enabled{};
  anchor::schema::address_t fee_collector{};
  anchor::schema::amount_t voucher_fee{};

  std::vector<std::pair<anchor::schema::address_t, anchor::schema::amount_t>>
      token_allocations;
};

/// Reason the configuration cannot start a chain, if any.
std::optional<std::string> validate(const genesis_config& genesis);

anchor::schema::registry_state_t make_registry_state(
    const genesis_config& genesis);
anchor::schema::hub_state_t make_hub_state(const genesis_config& genesis);
anchor::schema::spoke_state_t make_spoke_state(const genesis_config& genesis);
anchor::schema::token_state_t make_token_state(const genesis_config& genesis);

}  // namespace anchor::execution
