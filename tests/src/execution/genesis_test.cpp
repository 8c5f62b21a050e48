#include <gtest/gtest.h>
#include <anchor/execution/genesis.hpp>
#include <anchor/protocol/relayers.hpp>
#include <anchor/testing/hub_chain_fixture.hpp>

#include <limits>

namespace {

using namespace anchor::testing;

}  // namespace

TEST(genesis, hub_configuration_is_valid) {
  EXPECT_FALSE(anchor::execution::validate(make_hub_genesis()).has_value());
  EXPECT_FALSE(anchor::execution::validate(make_spoke_genesis()).has_value());
}

TEST(genesis, rejects_missing_identities) {
  auto no_chain = make_hub_genesis();
  no_chain.chain_id = 0;
  EXPECT_TRUE(anchor::execution::validate(no_chain).has_value());

  auto no_owner = make_hub_genesis();
  no_owner.owner = {};
  EXPECT_TRUE(anchor::execution::validate(no_owner).has_value());

  auto no_token = make_hub_genesis();
  no_token.token_address = {};
  EXPECT_TRUE(anchor::execution::validate(no_token).has_value());

  auto shared_address = make_hub_genesis();
  shared_address.hub_address = shared_address.registry_address;
  EXPECT_TRUE(anchor::execution::validate(shared_address).has_value());

  auto no_treasury = make_hub_genesis();
  no_treasury.treasury_wallet = {};
  EXPECT_TRUE(anchor::execution::validate(no_treasury).has_value());

  auto no_spoke = make_spoke_genesis();
  no_spoke.spoke_address = {};
  EXPECT_TRUE(anchor::execution::validate(no_spoke).has_value());
}

TEST(genesis, rejects_out_of_range_parameters) {
  auto bps = make_hub_genesis();
  bps.treasury_bps = 10'001;
  EXPECT_EQ(anchor::execution::validate(bps).value(),
            "treasury bps must be at most 10000");

  auto crowded = make_hub_genesis();
  crowded.relayers.clear();
  for (uint8_t i = 0; i < 10; ++i) {
    crowded.relayers.push_back(make_account(static_cast<uint8_t>(0x70 + i)));
  }
  EXPECT_TRUE(anchor::execution::validate(crowded).has_value());

  auto overflow = make_hub_genesis();
  overflow.token_allocations = {
      {kUser, std::numeric_limits<anchor::schema::amount_t>::max()},
      {kRelayer, 1}};
  EXPECT_EQ(anchor::execution::validate(overflow).value(),
            "token allocations overflow");
}

TEST(genesis, registry_state_carries_configuration) {
  auto genesis = make_hub_genesis();
  genesis.burn_wallet = kBurnWallet;
  auto state = anchor::execution::make_registry_state(genesis);
  EXPECT_EQ(state.config.owner, kOwner);
  EXPECT_EQ(state.config.self, kRegistry);
  EXPECT_EQ(state.config.voucher_hub, kHub);
  EXPECT_EQ(state.config.fees.verification_fee, anchor::schema::amount_t{100});
  EXPECT_EQ(state.config.split.treasury_bps, 7000u);
  EXPECT_EQ(state.config.split.burn_wallet.value(), kBurnWallet);
  EXPECT_TRUE(state.config.credit_payments_enabled);
  EXPECT_FALSE(state.config.paused);
}

TEST(genesis, owner_and_relayers_seed_relayer_set) {
  auto genesis = make_hub_genesis();
  genesis.relayers.push_back(kRelayer);
  genesis.relayers.push_back(anchor::schema::address_t{});
  auto state = anchor::execution::make_hub_state(genesis);
  EXPECT_EQ(state.relayers.count, 2u);
  EXPECT_TRUE(anchor::protocol::is_relayer(state.relayers, kOwner));
  EXPECT_TRUE(anchor::protocol::is_trusted_relayer(state.relayers, kRelayer));
}

TEST(genesis, hub_fee_collector_prefers_explicit_address) {
  auto genesis = make_hub_genesis();
  EXPECT_EQ(anchor::execution::make_hub_state(genesis).config.fee_collector,
            kTreasury);
  genesis.fee_collector = make_account(0x31);
  EXPECT_EQ(anchor::execution::make_hub_state(genesis).config.fee_collector,
            make_account(0x31));
}

TEST(genesis, spoke_state_uses_local_chain) {
  auto state = anchor::execution::make_spoke_state(make_spoke_genesis());
  EXPECT_EQ(state.config.local_chain_id, kPolygon);
  EXPECT_EQ(state.config.self, kSpoke);
  EXPECT_EQ(state.config.hub, kHub);
  EXPECT_EQ(state.fulfilled_count, 0u);
}

TEST(genesis, token_state_sums_allocations) {
  auto genesis = make_hub_genesis();
  genesis.token_allocations.emplace_back(kUser, 5);
  auto state = anchor::execution::make_token_state(genesis);
  EXPECT_EQ(state.total_supply,
            anchor::schema::amount_t{2 * kStartingBalance + 5});
  EXPECT_EQ(state.balances.at(kUser),
            anchor::schema::amount_t{kStartingBalance + 5});
}

TEST(genesis, chain_role_names) {
  EXPECT_EQ(anchor::execution::to_string(anchor::execution::chain_role_t::spoke),
            "spoke");
  EXPECT_EQ(anchor::schema::from_string(std::string_view{"hub"},
                                        anchor::execution::kChainRoleMappings)
                .value(),
            anchor::execution::chain_role_t::hub);
}
