#include <anchor/execution/genesis.hpp>
#include <anchor/protocol/relayers.hpp>
#include <limits>

using namespace anchor::schema;

namespace anchor::execution {

namespace {

relayer_set_t make_relayer_set(const genesis_config& genesis) {
  auto set = relayer_set_t{};
  anchor::protocol::seed_relayer(set, genesis.owner);
  for (const auto& relayer : genesis.relayers) {
    anchor::protocol::seed_relayer(set, relayer);
  }
  return set;
}

}  // namespace

std::optional<std::string> validate(const genesis_config& genesis) {
  if (genesis.chain_id == 0) {
    return "chain id must be non-zero";
  }
  if (is_zero(genesis.owner)) {
    return "owner address must be non-zero";
  }
  if (genesis.relayers.size() + 1 > kMaxRelayers) {
    return "at most 9 relayers besides the owner";
  }
  if (genesis.role == chain_role_t::spoke) {
    if (is_zero(genesis.spoke_address)) {
      return "spoke address must be non-zero";
    }
    return std::nullopt;
  }
  if (is_zero(genesis.registry_address) || is_zero(genesis.hub_address) ||
      is_zero(genesis.token_address)) {
    return "registry, hub and token addresses must be non-zero";
  }
  if (genesis.registry_address == genesis.hub_address ||
      genesis.registry_address == genesis.token_address ||
      genesis.hub_address == genesis.token_address) {
    return "registry, hub and token addresses must be distinct";
  }
  if (genesis.treasury_bps > kBasisPointsDenominator) {
    return "treasury bps must be at most 10000";
  }
  if (is_zero(genesis.treasury_wallet)) {
    return "treasury wallet must be non-zero";
  }
  auto supply = amount_t{};
  const auto max = std::numeric_limits<amount_t>::max();
  for (const auto& [holder, amount] : genesis.token_allocations) {
    if (is_zero(holder)) {
      return "token allocation to zero address";
    }
    if (supply > max - amount) {
      return "token allocations overflow";
    }
    supply += amount;
  }
  return std::nullopt;
}

registry_state_t make_registry_state(const genesis_config& genesis) {
  auto state = registry_state_t{};
  state.config.owner = genesis.owner;
  state.config.self = genesis.registry_address;
  state.config.voucher_hub = genesis.hub_address;
  state.config.fees = genesis.fees;
  state.config.split = fee_split_t{.treasury_bps = genesis.treasury_bps,
                                   .treasury_wallet = genesis.treasury_wallet,
                                   .burn_wallet = genesis.burn_wallet};
  state.config.credit_payments_enabled = genesis.credit_payments_enabled;
  state.relayers = make_relayer_set(genesis);
  return state;
}

hub_state_t make_hub_state(const genesis_config& genesis) {
  auto state = hub_state_t{};
  state.config.owner = genesis.owner;
  state.config.self = genesis.hub_address;
  state.config.registry = genesis.registry_address;
  state.config.fee_collector = is_zero(genesis.fee_collector)
                                   ? genesis.treasury_wallet
                                   : genesis.fee_collector;
  state.config.voucher_fee = genesis.voucher_fee;
  state.relayers = make_relayer_set(genesis);
  return state;
}

spoke_state_t make_spoke_state(const genesis_config& genesis) {
  auto state = spoke_state_t{};
  state.config.owner = genesis.owner;
  state.config.self = genesis.spoke_address;
  state.config.hub = genesis.hub_address;
  state.config.local_chain_id = genesis.chain_id;
  state.relayers = make_relayer_set(genesis);
  return state;
}

token_state_t make_token_state(const genesis_config& genesis) {
  auto state = token_state_t{};
  for (const auto& [holder, amount] : genesis.token_allocations) {
    state.balances[holder] += amount;
    state.total_supply += amount;
  }
  return state;
}

}  // namespace anchor::execution
