#include <gtest/gtest.h>
#include <anchor/protocol/result.hpp>
#include <anchor/protocol/verification_registry.hpp>
#include <anchor/testing/common.hpp>
#include <anchor/testing/hub_chain_fixture.hpp>

#include <limits>

namespace {

using anchor::schema::amount_t;
using anchor::schema::transaction_error_code;
using anchor::schema::verification_status_t;
using namespace anchor::testing;

constexpr auto kRegistryDelay = anchor::protocol::kRegistryTimelockDelay;

anchor::schema::transaction_result_t confirm(
    anchor::protocol::verification_registry& registry,
    const anchor::schema::hash32_t& q_hash,
    const anchor::schema::chain_id_t chain_id) {
  return registry.confirm_chain_verification(
      make_context(kRelayer),
      anchor::schema::confirm_chain_verification_t{.q_hash = q_hash,
                                                   .chain_id = chain_id});
}

anchor::schema::transaction_result_t owner_pause(
    anchor::protocol::verification_registry& registry,
    const anchor::schema::pause_scope_t scope,
    const bool paused) {
  return registry.set_pause(
      make_context(kOwner),
      anchor::schema::set_pause_t{
          .scope = scope, .paused = paused, .reason = "incident"});
}

}  // namespace

TEST(verification_registry, direct_payment_verifies_and_issues_voucher) {
  auto chain = hub_chain_fixture{};
  chain.approve_registry(kUser, 1'000);
  auto q_hash = make_hash(0x40);

  auto result = chain.verify(q_hash, {kPolygon, kArbitrum});
  ASSERT_EQ(result.code, 0u) << result.log;

  auto expected_voucher = anchor::protocol::make_voucher_id(
      q_hash, anchor::protocol::make_verifier_id("zk-kyc"), 1'000, 0);
  EXPECT_EQ(result.data,
            anchor::schema::make_bytes(
                anchor::schema::bytes_view_t{expected_voucher}));
  EXPECT_EQ(chain.registry().voucher_for(q_hash).value(), expected_voucher);
  EXPECT_FALSE(chain.registry().is_fallback_voucher(q_hash));

  // 100 + 2 * 10 split 70/30 with no burn wallet configured.
  EXPECT_EQ(chain.token().balance_of(kUser), amount_t{kStartingBalance - 120});
  EXPECT_EQ(chain.token().balance_of(kTreasury), amount_t{84});
  EXPECT_EQ(chain.token().balance_of(anchor::schema::kDeadAddress),
            amount_t{36});
  EXPECT_EQ(chain.token().allowance(kUser, kRegistry), amount_t{880});
  EXPECT_EQ(event_attribute(result, "fee_paid", "path").value(), "direct");
  EXPECT_TRUE(has_event(result, "voucher_created"));
  EXPECT_TRUE(has_event(result, "data_verified"));

  auto record = chain.registry().find_record(q_hash);
  ASSERT_TRUE(record.has_value());
  EXPECT_TRUE(record->verified);
  EXPECT_EQ(record->verifier, kUser);
  EXPECT_EQ(record->verified_at, 1'000u);
  EXPECT_EQ(record->nonce, 0u);
  EXPECT_EQ(record->proof_id, "proof-1");
  EXPECT_EQ(chain.registry().nonce(kUser), 1u);
  EXPECT_EQ(chain.registry().state().ledger.verification_count, 1u);

  auto voucher = chain.hub().find_voucher(expected_voucher);
  ASSERT_TRUE(voucher.has_value());
  EXPECT_EQ(voucher->creator, kRegistry);
  EXPECT_EQ(voucher->q_hash, q_hash);
}

TEST(verification_registry, status_follows_chain_confirmations) {
  auto chain = hub_chain_fixture{};
  chain.approve_registry(kUser, 1'000);
  auto q_hash = make_hash(0x41);
  EXPECT_EQ(chain.registry().status(q_hash), verification_status_t::not_found);
  ASSERT_EQ(chain.verify(q_hash, {kPolygon, kArbitrum}).code, 0u);
  EXPECT_EQ(chain.registry().status(q_hash),
            verification_status_t::verified_crosschain_initiated);

  ASSERT_EQ(confirm(chain.registry(), q_hash, kPolygon).code, 0u);
  EXPECT_EQ(chain.registry().status(q_hash),
            verification_status_t::verified_crosschain_propagating);
  EXPECT_TRUE(chain.registry().is_chain_confirmed(q_hash, kPolygon));

  ASSERT_EQ(confirm(chain.registry(), q_hash, kArbitrum).code, 0u);
  EXPECT_EQ(chain.registry().status(q_hash),
            verification_status_t::verified_crosschain_propagated);

  EXPECT_TRUE(anchor::protocol::has_error(
      confirm(chain.registry(), q_hash, kPolygon),
      transaction_error_code::chain_already_confirmed));
  EXPECT_TRUE(anchor::protocol::has_error(
      confirm(chain.registry(), q_hash, 10),
      transaction_error_code::chain_not_targeted));
  EXPECT_TRUE(anchor::protocol::has_error(
      confirm(chain.registry(), make_hash(0x99), kPolygon),
      transaction_error_code::verification_missing));
}

TEST(verification_registry, local_only_verification_is_verified) {
  auto chain = hub_chain_fixture{};
  chain.approve_registry(kUser, 100);
  auto q_hash = make_hash(0x42);
  ASSERT_EQ(chain.verify(q_hash).code, 0u);
  EXPECT_EQ(chain.registry().status(q_hash), verification_status_t::verified);
  EXPECT_EQ(chain.token().allowance(kUser, kRegistry), amount_t{0});
}

TEST(verification_registry, duplicate_q_hash_is_rejected_without_charge) {
  auto chain = hub_chain_fixture{};
  chain.approve_registry(kUser, 1'000);
  auto q_hash = make_hash(0x43);
  ASSERT_EQ(chain.verify(q_hash).code, 0u);
  auto balance = chain.token().balance_of(kUser);

  auto duplicate = chain.verify(q_hash, {}, 2'000);
  EXPECT_TRUE(anchor::protocol::has_error(
      duplicate, transaction_error_code::already_verified));
  EXPECT_TRUE(has_event(duplicate, "verification_failed"));
  EXPECT_EQ(chain.token().balance_of(kUser), balance);
  EXPECT_EQ(chain.registry().find_record(q_hash)->verified_at, 1'000u);
  EXPECT_EQ(chain.registry().nonce(kUser), 1u);
}

TEST(verification_registry, input_validation) {
  auto chain = hub_chain_fixture{};
  chain.approve_registry(kUser, 1'000);
  auto& registry = chain.registry();

  auto request = anchor::schema::verify_data_t{.user = kUser,
                                               .q_hash = make_hash(0x44),
                                               .target_chain_ids = {},
                                               .proof_id = "proof",
                                               .verification_type = ""};
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.verify_data(make_context(kStranger), request),
      transaction_error_code::not_relayer));

  auto zero_hash = request;
  zero_hash.q_hash = anchor::schema::hash32_t{};
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.verify_data(make_context(kRelayer), zero_hash),
      transaction_error_code::invalid_q_hash));

  auto zero_user = request;
  zero_user.user = anchor::schema::address_t{};
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.verify_data(make_context(kRelayer), zero_user),
      transaction_error_code::invalid_address));

  auto no_proof = request;
  no_proof.proof_id.clear();
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.verify_data(make_context(kRelayer), no_proof),
      transaction_error_code::empty_proof_id));

  auto repeated_chain = request;
  repeated_chain.target_chain_ids = {kPolygon, kPolygon};
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.verify_data(make_context(kRelayer), repeated_chain),
      transaction_error_code::invalid_target_chains));

  auto zero_chain = request;
  zero_chain.target_chain_ids = {0};
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.verify_data(make_context(kRelayer), zero_chain),
      transaction_error_code::invalid_target_chains));

  EXPECT_EQ(registry.state().ledger.verification_count, 0u);

  // An empty verification type is accepted on the verify path.
  ASSERT_EQ(registry.verify_data(make_context(kRelayer), request).code, 0u);
}

TEST(verification_registry, fee_requires_allowance_and_balance) {
  auto chain = hub_chain_fixture{};
  auto q_hash = make_hash(0x45);
  auto no_allowance = chain.verify(q_hash);
  EXPECT_TRUE(anchor::protocol::has_error(
      no_allowance, transaction_error_code::insufficient_allowance));
  EXPECT_TRUE(has_event(no_allowance, "verification_failed"));
  EXPECT_EQ(chain.registry().status(q_hash), verification_status_t::not_found);

  auto poor = make_account(0x30);
  chain.approve_registry(poor, 1'000);
  auto result = chain.registry().verify_data(
      make_context(kRelayer),
      anchor::schema::verify_data_t{.user = poor,
                                    .q_hash = q_hash,
                                    .target_chain_ids = {},
                                    .proof_id = "proof",
                                    .verification_type = "zk-kyc"});
  EXPECT_TRUE(anchor::protocol::has_error(
      result, transaction_error_code::insufficient_balance));
}

TEST(verification_registry, credit_path_pays_from_relayer_pool) {
  auto chain = hub_chain_fixture{};
  auto& registry = chain.registry();
  chain.approve_registry(kRelayer, 500);

  auto deposit = registry.deposit_relayer_credits(
      make_context(kRelayer),
      anchor::schema::deposit_relayer_credits_t{.amount = 500});
  ASSERT_EQ(deposit.code, 0u) << deposit.log;
  EXPECT_EQ(registry.relayer_credits(kRelayer), amount_t{500});
  EXPECT_EQ(chain.token().balance_of(kRegistry), amount_t{500});
  EXPECT_EQ(chain.token().balance_of(kRelayer),
            amount_t{kStartingBalance - 500});

  auto allocate = registry.allocate_user_credits(
      make_context(kRelayer),
      anchor::schema::allocate_user_credits_t{.user = kUser, .amount = 200});
  ASSERT_EQ(allocate.code, 0u);
  EXPECT_EQ(registry.relayer_credits(kRelayer), amount_t{300});
  EXPECT_EQ(registry.user_credits(kRelayer, kUser), amount_t{200});

  auto result = chain.verify(make_hash(0x46));
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(event_attribute(result, "fee_paid", "path").value(), "credit");
  EXPECT_EQ(registry.user_credits(kRelayer, kUser), amount_t{100});
  EXPECT_EQ(chain.token().balance_of(kRegistry), amount_t{400});
  EXPECT_EQ(chain.token().balance_of(kTreasury), amount_t{70});
  EXPECT_EQ(chain.token().balance_of(anchor::schema::kDeadAddress),
            amount_t{30});
  EXPECT_EQ(chain.token().balance_of(kUser), amount_t{kStartingBalance});
}

TEST(verification_registry, disabled_credit_payments_fall_back_to_direct) {
  auto chain = hub_chain_fixture{};
  auto& registry = chain.registry();
  chain.approve_registry(kRelayer, 500);
  ASSERT_EQ(registry
                .deposit_relayer_credits(
                    make_context(kRelayer),
                    anchor::schema::deposit_relayer_credits_t{.amount = 500})
                .code,
            0u);
  ASSERT_EQ(registry
                .allocate_user_credits(make_context(kRelayer),
                                       anchor::schema::allocate_user_credits_t{
                                           .user = kUser, .amount = 200})
                .code,
            0u);
  ASSERT_EQ(registry
                .set_credit_payments(
                    make_context(kOwner),
                    anchor::schema::set_credit_payments_t{.enabled = false})
                .code,
            0u);

  EXPECT_TRUE(anchor::protocol::has_error(
      chain.verify(make_hash(0x47)),
      transaction_error_code::insufficient_allowance));
  EXPECT_EQ(registry.user_credits(kRelayer, kUser), amount_t{200});
}

TEST(verification_registry, credit_operations_validate_inputs) {
  auto chain = hub_chain_fixture{};
  auto& registry = chain.registry();
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.deposit_relayer_credits(
          make_context(kRelayer),
          anchor::schema::deposit_relayer_credits_t{.amount = 0}),
      transaction_error_code::invalid_amount));
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.deposit_relayer_credits(
          make_context(kRelayer),
          anchor::schema::deposit_relayer_credits_t{.amount = 10}),
      transaction_error_code::insufficient_allowance));
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.deposit_relayer_credits(
          make_context(kStranger),
          anchor::schema::deposit_relayer_credits_t{.amount = 10}),
      transaction_error_code::not_relayer));
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.allocate_user_credits(
          make_context(kRelayer),
          anchor::schema::allocate_user_credits_t{.user = kUser, .amount = 1}),
      transaction_error_code::insufficient_credits));
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.set_credit_payments(
          make_context(kRelayer),
          anchor::schema::set_credit_payments_t{.enabled = false}),
      transaction_error_code::not_owner));
}

TEST(verification_registry, hub_failure_records_fallback_voucher) {
  auto chain = hub_chain_fixture{};
  chain.approve_registry(kUser, 1'000);
  ASSERT_EQ(chain.hub()
                .set_pause(make_context(kOwner),
                           anchor::schema::set_pause_t{
                               .scope = anchor::schema::pause_scope_t::
                                   voucher_creation,
                               .paused = true,
                               .reason = "maintenance"})
                .code,
            0u);

  auto q_hash = make_hash(0x48);
  auto result = chain.verify(q_hash, {kPolygon}, 1'234);
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_TRUE(has_event(result, "voucher_fallback"));
  EXPECT_FALSE(has_event(result, "voucher_created"));

  const auto failure = std::string{"anchor.hub:62 voucher creation is paused"};
  auto expected = anchor::protocol::make_fallback_voucher_id(q_hash, kUser,
                                                             1'234, failure);
  EXPECT_EQ(chain.registry().voucher_for(q_hash).value(), expected);
  EXPECT_TRUE(chain.registry().is_fallback_voucher(q_hash));
  EXPECT_EQ(chain.registry().state().ledger.fallback_vouchers.at(q_hash),
            failure);
  EXPECT_EQ(chain.registry().status(q_hash),
            verification_status_t::verified_propagation_failed);
  EXPECT_TRUE(chain.hub().state().vouchers.empty());
}

TEST(verification_registry, missing_hub_client_uses_fallback) {
  auto genesis = make_hub_genesis();
  auto token = anchor::protocol::token_ledger{
      anchor::execution::make_token_state(genesis)};
  auto registry = anchor::protocol::verification_registry{
      anchor::execution::make_registry_state(genesis), token};
  ASSERT_EQ(token
                .approve(make_context(kUser),
                         anchor::schema::token_approve_t{.spender = kRegistry,
                                                         .amount = 100})
                .code,
            0u);
  auto q_hash = make_hash(0x49);
  auto result = registry.verify_data(
      make_context(kRelayer),
      anchor::schema::verify_data_t{.user = kUser,
                                    .q_hash = q_hash,
                                    .target_chain_ids = {},
                                    .proof_id = "proof",
                                    .verification_type = "zk-kyc"});
  ASSERT_EQ(result.code, 0u);
  EXPECT_TRUE(registry.is_fallback_voucher(q_hash));
}

TEST(verification_registry, local_only_fallback_is_still_verified) {
  auto chain = hub_chain_fixture{};
  chain.approve_registry(kUser, 1'000);
  ASSERT_EQ(chain.hub()
                .set_pause(make_context(kOwner),
                           anchor::schema::set_pause_t{
                               .scope = anchor::schema::pause_scope_t::
                                   voucher_creation,
                               .paused = true,
                               .reason = "maintenance"})
                .code,
            0u);

  auto q_hash = make_hash(0x4A);
  auto result = chain.verify(q_hash);
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_TRUE(has_event(result, "voucher_fallback"));
  EXPECT_TRUE(chain.registry().is_fallback_voucher(q_hash));
  EXPECT_EQ(chain.registry().status(q_hash), verification_status_t::verified);
}

TEST(verification_registry, fee_overflow_rejects_without_charging) {
  auto genesis = make_hub_genesis();
  genesis.fees.cross_chain_fee = std::numeric_limits<amount_t>::max();
  auto chain = hub_chain_fixture{genesis};
  chain.approve_registry(kUser, 1'000);

  auto q_hash = make_hash(0x4B);
  auto result = chain.verify(q_hash, {kPolygon, kArbitrum});
  EXPECT_TRUE(
      anchor::protocol::has_error(result, transaction_error_code::fee_overflow));
  EXPECT_TRUE(has_event(result, "verification_failed"));
  EXPECT_EQ(chain.token().balance_of(kUser), amount_t{kStartingBalance});
  EXPECT_EQ(chain.token().balance_of(kTreasury), amount_t{0});
  EXPECT_EQ(chain.token().allowance(kUser, kRegistry), amount_t{1'000});
  EXPECT_FALSE(chain.registry().state().ledger.records.contains(q_hash));
  EXPECT_EQ(chain.registry().status(q_hash), verification_status_t::not_found);
}

TEST(verification_registry, batch_confirmation_is_atomic) {
  auto chain = hub_chain_fixture{};
  chain.approve_registry(kUser, 1'000);
  auto first = make_hash(0x50);
  auto second = make_hash(0x51);
  ASSERT_EQ(chain.verify(first, {kPolygon}).code, 0u);
  ASSERT_EQ(chain.verify(second, {kPolygon}).code, 0u);
  auto& registry = chain.registry();

  auto invalid = registry.confirm_chain_verification_batch(
      make_context(kRelayer),
      anchor::schema::confirm_chain_verification_batch_t{
          .q_hashes = {first, second, make_hash(0x52)},
          .chain_ids = {kPolygon, kPolygon, kPolygon}});
  EXPECT_TRUE(anchor::protocol::has_error(
      invalid, transaction_error_code::verification_missing));
  EXPECT_FALSE(registry.is_chain_confirmed(first, kPolygon));
  EXPECT_FALSE(registry.is_chain_confirmed(second, kPolygon));

  EXPECT_TRUE(anchor::protocol::has_error(
      registry.confirm_chain_verification_batch(
          make_context(kRelayer),
          anchor::schema::confirm_chain_verification_batch_t{
              .q_hashes = {first}, .chain_ids = {kPolygon, kArbitrum}}),
      transaction_error_code::array_length_mismatch));
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.confirm_chain_verification_batch(
          make_context(kRelayer),
          anchor::schema::confirm_chain_verification_batch_t{}),
      transaction_error_code::empty_batch));

  ASSERT_EQ(confirm(registry, first, kPolygon).code, 0u);
  auto batch = registry.confirm_chain_verification_batch(
      make_context(kRelayer),
      anchor::schema::confirm_chain_verification_batch_t{
          .q_hashes = {first, second}, .chain_ids = {kPolygon, kPolygon}});
  ASSERT_EQ(batch.code, 0u);
  EXPECT_EQ(event_attribute(batch, "chain_verification_batch_confirmed",
                            "confirmed")
                .value(),
            "1");
  EXPECT_EQ(event_attribute(batch, "chain_verification_batch_confirmed",
                            "skipped")
                .value(),
            "1");
  EXPECT_TRUE(registry.is_chain_confirmed(second, kPolygon));
}

TEST(verification_registry, confirmations_require_trusted_relayer) {
  auto chain = hub_chain_fixture{};
  chain.approve_registry(kUser, 1'000);
  auto q_hash = make_hash(0x53);
  ASSERT_EQ(chain.verify(q_hash, {kPolygon}).code, 0u);
  EXPECT_TRUE(anchor::protocol::has_error(
      chain.registry().confirm_chain_verification(
          make_context(kStranger),
          anchor::schema::confirm_chain_verification_t{.q_hash = q_hash,
                                                       .chain_id = kPolygon}),
      transaction_error_code::not_trusted_relayer));
}

TEST(verification_registry, relayer_set_keeps_one_member) {
  auto chain = hub_chain_fixture{};
  auto& registry = chain.registry();
  EXPECT_TRUE(registry.is_relayer(kOwner));
  EXPECT_TRUE(registry.is_relayer(kRelayer));

  EXPECT_TRUE(anchor::protocol::has_error(
      registry.set_relayer(make_context(kStranger),
                           anchor::schema::set_relayer_t{
                               .relayer = kStranger, .authorized = true}),
      transaction_error_code::not_owner));
  ASSERT_EQ(registry
                .set_relayer(make_context(kOwner),
                             anchor::schema::set_relayer_t{
                                 .relayer = kRelayer, .authorized = false})
                .code,
            0u);
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.set_relayer(make_context(kOwner),
                           anchor::schema::set_relayer_t{
                               .relayer = kOwner, .authorized = false}),
      transaction_error_code::last_relayer));
  EXPECT_FALSE(registry.is_relayer(kRelayer));
}

TEST(verification_registry, verifier_directory_lifecycle) {
  auto chain = hub_chain_fixture{};
  auto& registry = chain.registry();
  auto registered = registry.register_verifier(
      make_context(kOwner),
      anchor::schema::register_verifier_t{.verification_type = "zk-kyc"});
  ASSERT_EQ(registered.code, 0u);
  auto verifier_id = anchor::protocol::make_verifier_id("zk-kyc");
  EXPECT_EQ(registered.data, anchor::schema::make_bytes(
                                 anchor::schema::bytes_view_t{verifier_id}));
  EXPECT_TRUE(registry.find_verifier(verifier_id)->active);
  EXPECT_EQ(registry.state().verifiers.active_count, 1u);

  EXPECT_TRUE(anchor::protocol::has_error(
      registry.register_verifier(
          make_context(kOwner),
          anchor::schema::register_verifier_t{.verification_type = "zk-kyc"}),
      transaction_error_code::verifier_exists));
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.register_verifier(
          make_context(kOwner),
          anchor::schema::register_verifier_t{.verification_type = ""}),
      transaction_error_code::empty_verification_type));

  auto deactivated = registry.set_verifier_active(
      make_context(kOwner),
      anchor::schema::set_verifier_active_t{.verifier_id = verifier_id,
                                            .active = false});
  ASSERT_EQ(deactivated.code, 0u);
  EXPECT_TRUE(has_event(deactivated, "verifier_deactivated"));
  EXPECT_FALSE(registry.find_verifier(verifier_id)->active);
  EXPECT_EQ(registry.state().verifiers.active_count, 0u);
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.set_verifier_active(
          make_context(kOwner),
          anchor::schema::set_verifier_active_t{.verifier_id = verifier_id,
                                                .active = false}),
      transaction_error_code::verifier_already_inactive));
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.set_verifier_active(
          make_context(kOwner),
          anchor::schema::set_verifier_active_t{.verifier_id = make_hash(1),
                                                .active = true}),
      transaction_error_code::verifier_missing));
}

TEST(verification_registry, pause_gates_state_changes) {
  auto chain = hub_chain_fixture{};
  chain.approve_registry(kUser, 1'000);
  auto& registry = chain.registry();
  ASSERT_EQ(owner_pause(registry, anchor::schema::pause_scope_t::global, true)
                .code,
            0u);
  EXPECT_TRUE(anchor::protocol::has_error(
      owner_pause(registry, anchor::schema::pause_scope_t::global, true),
      transaction_error_code::already_paused));
  EXPECT_TRUE(anchor::protocol::has_error(
      chain.verify(make_hash(0x54)), transaction_error_code::paused));
  ASSERT_EQ(owner_pause(registry, anchor::schema::pause_scope_t::global, false)
                .code,
            0u);

  ASSERT_EQ(
      owner_pause(registry, anchor::schema::pause_scope_t::cross_chain, true)
          .code,
      0u);
  EXPECT_TRUE(anchor::protocol::has_error(
      chain.verify(make_hash(0x55), {kPolygon}),
      transaction_error_code::cross_chain_paused));
  EXPECT_EQ(chain.verify(make_hash(0x55)).code, 0u);

  EXPECT_TRUE(anchor::protocol::has_error(
      registry.set_pause(make_context(kOwner),
                         anchor::schema::set_pause_t{
                             .scope = anchor::schema::pause_scope_t::global,
                             .paused = true,
                             .reason = ""}),
      transaction_error_code::empty_reason));
  EXPECT_TRUE(anchor::protocol::has_error(
      owner_pause(registry, anchor::schema::pause_scope_t::voucher_creation,
                  true),
      transaction_error_code::unsupported_operation));
}

TEST(verification_registry, fee_schedule_changes_after_two_days) {
  auto chain = hub_chain_fixture{};
  auto& registry = chain.registry();
  auto scheduled = registry.schedule_change(
      make_context(kOwner, 1'000),
      anchor::schema::schedule_change_t{
          .action = anchor::schema::timelock_action_t::set_fee_schedule,
          .value = anchor::schema::fee_schedule_t{.verification_fee = 200,
                                                  .cross_chain_fee = 20}});
  ASSERT_EQ(scheduled.code, 0u);

  auto execute = anchor::schema::execute_change_t{
      .action = anchor::schema::timelock_action_t::set_fee_schedule};
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.execute_change(make_context(kOwner, 1'000 + kRegistryDelay - 1),
                              execute),
      transaction_error_code::timelock_not_expired));
  EXPECT_EQ(registry.fee_quote(2).value(), amount_t{120});

  auto executed = registry.execute_change(
      make_context(kOwner, 1'000 + kRegistryDelay), execute);
  ASSERT_EQ(executed.code, 0u);
  EXPECT_TRUE(has_event(executed, "fees_updated"));
  EXPECT_EQ(registry.fee_quote(2).value(), amount_t{240});
}

TEST(verification_registry, schedule_change_validates_values) {
  auto chain = hub_chain_fixture{};
  auto& registry = chain.registry();
  auto schedule = [&](const anchor::schema::timelock_action_t action,
                      anchor::schema::change_value_t value) {
    return registry.schedule_change(
        make_context(kOwner),
        anchor::schema::schedule_change_t{.action = action,
                                          .value = std::move(value)});
  };
  EXPECT_TRUE(anchor::protocol::has_error(
      schedule(anchor::schema::timelock_action_t::set_treasury_split,
               uint16_t{10'001}),
      transaction_error_code::invalid_basis_points));
  EXPECT_TRUE(anchor::protocol::has_error(
      schedule(anchor::schema::timelock_action_t::set_treasury_split,
               make_account(5)),
      transaction_error_code::invalid_change_value));
  EXPECT_TRUE(anchor::protocol::has_error(
      schedule(anchor::schema::timelock_action_t::set_treasury_wallet,
               anchor::schema::address_t{}),
      transaction_error_code::invalid_address));
  EXPECT_TRUE(anchor::protocol::has_error(
      schedule(anchor::schema::timelock_action_t::set_registry,
               make_account(5)),
      transaction_error_code::unsupported_action));
  EXPECT_TRUE(anchor::protocol::has_error(
      registry.schedule_change(
          make_context(kStranger),
          anchor::schema::schedule_change_t{
              .action = anchor::schema::timelock_action_t::set_treasury_wallet,
              .value = make_account(5)}),
      transaction_error_code::not_owner));
}

TEST(verification_registry, burn_wallet_can_be_set_and_cleared) {
  auto chain = hub_chain_fixture{};
  auto& registry = chain.registry();
  auto apply = [&](const anchor::schema::address_t& wallet,
                   const anchor::schema::timestamp_seconds_t now) {
    auto scheduled = registry.schedule_change(
        make_context(kOwner, now),
        anchor::schema::schedule_change_t{
            .action = anchor::schema::timelock_action_t::set_burn_wallet,
            .value = wallet});
    ASSERT_EQ(scheduled.code, 0u);
    auto executed = registry.execute_change(
        make_context(kOwner, now + kRegistryDelay),
        anchor::schema::execute_change_t{
            .action = anchor::schema::timelock_action_t::set_burn_wallet});
    ASSERT_EQ(executed.code, 0u);
  };

  apply(kBurnWallet, 1'000);
  EXPECT_EQ(registry.state().config.split.burn_wallet.value(), kBurnWallet);

  chain.approve_registry(kUser, 1'000);
  ASSERT_EQ(chain.verify(make_hash(0x56), {}, 1'000 + kRegistryDelay).code, 0u);
  EXPECT_EQ(chain.token().balance_of(kBurnWallet), amount_t{30});

  apply(anchor::schema::address_t{}, 500'000);
  EXPECT_FALSE(registry.state().config.split.burn_wallet.has_value());
}
