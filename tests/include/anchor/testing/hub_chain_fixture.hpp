#pragma once

#include <gtest/gtest.h>

#include <anchor/execution/genesis.hpp>
#include <anchor/protocol/result.hpp>
#include <anchor/protocol/token_ledger.hpp>
#include <anchor/protocol/verification_registry.hpp>
#include <anchor/protocol/voucher_hub.hpp>
#include <anchor/protocol/voucher_spoke.hpp>
#include <anchor/testing/common.hpp>

#include <utility>
#include <vector>

namespace anchor::testing {

inline const auto kOwner = make_account(1);
inline const auto kRelayer = make_account(2);
inline const auto kStranger = make_account(3);
inline const auto kRegistry = make_account(0x10);
inline const auto kHub = make_account(0x11);
inline const auto kToken = make_account(0x12);
inline const auto kTreasury = make_account(0x13);
inline const auto kBurnWallet = make_account(0x14);
inline const auto kSpoke = make_account(0x15);
inline const auto kUser = make_account(0x20);

inline constexpr anchor::schema::chain_id_t kHubChainId = 1;
inline constexpr anchor::schema::chain_id_t kPolygon = 137;
inline constexpr anchor::schema::chain_id_t kArbitrum = 42161;

inline constexpr uint64_t kStartingBalance = 1'000'000;

/// Hub chain with base fee 100, 10 per target chain and a 70/30 split.
inline anchor::execution::genesis_config make_hub_genesis() {
  auto genesis = anchor::execution::genesis_config{};
  genesis.role = anchor::execution::chain_role_t::hub;
  genesis.chain_id = kHubChainId;
  genesis.owner = kOwner;
  genesis.relayers = {kRelayer};
  genesis.registry_address = kRegistry;
  genesis.hub_address = kHub;
  genesis.token_address = kToken;
  genesis.fees = anchor::schema::fee_schedule_t{.verification_fee = 100,
                                                .cross_chain_fee = 10};
  genesis.treasury_bps = 7000;
  genesis.treasury_wallet = kTreasury;
  genesis.credit_payments_enabled = true;
  genesis.voucher_fee = 5;
  genesis.token_allocations = {{kUser, kStartingBalance},
                               {kRelayer, kStartingBalance}};
  return genesis;
}

inline anchor::execution::genesis_config make_spoke_genesis() {
  auto genesis = anchor::execution::genesis_config{};
  genesis.role = anchor::execution::chain_role_t::spoke;
  genesis.chain_id = kPolygon;
  genesis.owner = kOwner;
  genesis.relayers = {kRelayer};
  genesis.hub_address = kHub;
  genesis.spoke_address = kSpoke;
  return genesis;
}

/// Token, hub and registry wired together the way the engine wires them.
class hub_chain_fixture {
 public:
  explicit hub_chain_fixture(
      anchor::execution::genesis_config genesis = make_hub_genesis())
      : genesis_{std::move(genesis)},
        token_{anchor::execution::make_token_state(genesis_)},
        hub_{anchor::execution::make_hub_state(genesis_)},
        registry_{anchor::execution::make_registry_state(genesis_), token_} {
    registry_.set_voucher_hub_client(
        [this](const anchor::schema::address_t& hub_address,
               const anchor::protocol::call_context& context,
               const anchor::schema::create_voucher_t& operation) {
          if (hub_address != hub_.state().config.self) {
            return anchor::protocol::make_error(
                anchor::schema::transaction_error_code::voucher_hub_unavailable,
                anchor::protocol::kEngineCodespace, "no voucher hub at address");
          }
          return hub_.create_voucher(context, operation);
        });
  }

  hub_chain_fixture(const hub_chain_fixture&) = delete;
  hub_chain_fixture& operator=(const hub_chain_fixture&) = delete;

  const anchor::execution::genesis_config& genesis() const { return genesis_; }
  anchor::protocol::token_ledger& token() { return token_; }
  anchor::protocol::voucher_hub& hub() { return hub_; }
  anchor::protocol::verification_registry& registry() { return registry_; }

  void approve_registry(const anchor::schema::address_t& owner,
                        const anchor::schema::amount_t& amount) {
    auto result = token_.approve(
        make_context(owner),
        anchor::schema::token_approve_t{.spender = kRegistry, .amount = amount});
    ASSERT_EQ(result.code, 0u);
  }

  anchor::schema::transaction_result_t verify(
      const anchor::schema::hash32_t& q_hash,
      std::vector<anchor::schema::chain_id_t> targets = {},
      const anchor::schema::timestamp_seconds_t timestamp = 1'000) {
    return registry_.verify_data(
        make_context(kRelayer, timestamp),
        anchor::schema::verify_data_t{.user = kUser,
                                      .q_hash = q_hash,
                                      .target_chain_ids = std::move(targets),
                                      .proof_id = "proof-1",
                                      .verification_type = "zk-kyc"});
  }

 private:
  anchor::execution::genesis_config genesis_;
  anchor::protocol::token_ledger token_;
  anchor::protocol::voucher_hub hub_;
  anchor::protocol::verification_registry registry_;
};

}  // namespace anchor::testing
