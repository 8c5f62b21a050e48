#pragma once
#include <anchor/schema/primitives.hpp>
#include <map>
#include <utility>

// Schema type: credit ledger.
// Protocol workflow: Relayer-funded balances. Deposits land in the relayer
// pool; allocations move pool funds into a (relayer, user) slice that fee
// payments draw down.
namespace anchor::schema {

template <uint16_t Version>
struct credit_ledger;

template <>
struct credit_ledger<1> final {
  uint16_t version{1};
  std::map<address_t, amount_t> relayer_pools;
  std::map<std::pair<address_t, address_t>, amount_t> user_allocations;
};

using credit_ledger_t = credit_ledger<1>;

}  // namespace anchor::schema
