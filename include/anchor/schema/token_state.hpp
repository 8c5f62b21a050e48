#pragma once
#include <anchor/schema/primitives.hpp>
#include <map>
#include <utility>

// Schema type: token state.
// Protocol workflow: Fungible fee token balances and allowances
// ((owner, spender) -> amount).
namespace anchor::schema {

template <uint16_t Version>
struct token_state;

template <>
struct token_state<1> final {
  uint16_t version{1};
  std::map<address_t, amount_t> balances;
  std::map<std::pair<address_t, address_t>, amount_t> allowances;
  amount_t total_supply{};
};

using token_state_t = token_state<1>;

}  // namespace anchor::schema
