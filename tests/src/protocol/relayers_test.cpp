#include <gtest/gtest.h>
#include <anchor/protocol/relayers.hpp>
#include <anchor/protocol/result.hpp>
#include <anchor/testing/common.hpp>

namespace {

using anchor::schema::transaction_error_code;
using anchor::testing::make_account;

anchor::schema::set_relayer_t grant(const anchor::schema::address_t& relayer) {
  return anchor::schema::set_relayer_t{.relayer = relayer, .authorized = true};
}

anchor::schema::set_relayer_t revoke(const anchor::schema::address_t& relayer) {
  return anchor::schema::set_relayer_t{.relayer = relayer, .authorized = false};
}

}  // namespace

TEST(relayers, seed_ignores_zero_duplicates_and_overflow) {
  auto set = anchor::schema::relayer_set_t{};
  anchor::protocol::seed_relayer(set, anchor::schema::address_t{});
  anchor::protocol::seed_relayer(set, make_account(1));
  anchor::protocol::seed_relayer(set, make_account(1));
  EXPECT_EQ(set.count, 1u);
  EXPECT_TRUE(anchor::protocol::is_relayer(set, make_account(1)));
  EXPECT_TRUE(anchor::protocol::is_trusted_relayer(set, make_account(1)));

  for (uint8_t seed = 2; seed < 20; ++seed) {
    anchor::protocol::seed_relayer(set, make_account(seed));
  }
  EXPECT_EQ(set.count, anchor::schema::kMaxRelayers);
  EXPECT_FALSE(anchor::protocol::is_relayer(set, make_account(19)));
}

TEST(relayers, grant_and_revoke_move_both_roles_together) {
  auto set = anchor::schema::relayer_set_t{};
  anchor::protocol::seed_relayer(set, make_account(1));

  auto added = anchor::protocol::apply_set_relayer(set, grant(make_account(2)),
                                                   "test");
  ASSERT_EQ(added.code, 0u);
  ASSERT_EQ(added.events.size(), 1u);
  EXPECT_EQ(added.events[0].type, "relayer_updated");
  EXPECT_EQ(set.count, 2u);
  EXPECT_TRUE(anchor::protocol::is_trusted_relayer(set, make_account(2)));

  auto removed = anchor::protocol::apply_set_relayer(
      set, revoke(make_account(2)), "test");
  ASSERT_EQ(removed.code, 0u);
  EXPECT_EQ(set.count, 1u);
  EXPECT_FALSE(anchor::protocol::is_relayer(set, make_account(2)));
  EXPECT_FALSE(anchor::protocol::is_trusted_relayer(set, make_account(2)));
}

TEST(relayers, rejects_invalid_transitions) {
  auto set = anchor::schema::relayer_set_t{};
  anchor::protocol::seed_relayer(set, make_account(1));

  EXPECT_TRUE(anchor::protocol::has_error(
      anchor::protocol::apply_set_relayer(set, grant(anchor::schema::address_t{}),
                                          "test"),
      transaction_error_code::invalid_address));
  EXPECT_TRUE(anchor::protocol::has_error(
      anchor::protocol::apply_set_relayer(set, grant(make_account(1)), "test"),
      transaction_error_code::relayer_exists));
  EXPECT_TRUE(anchor::protocol::has_error(
      anchor::protocol::apply_set_relayer(set, revoke(make_account(9)), "test"),
      transaction_error_code::relayer_missing));
  EXPECT_TRUE(anchor::protocol::has_error(
      anchor::protocol::apply_set_relayer(set, revoke(make_account(1)), "test"),
      transaction_error_code::last_relayer));
  EXPECT_TRUE(anchor::protocol::is_relayer(set, make_account(1)));
}

TEST(relayers, limit_is_enforced) {
  auto set = anchor::schema::relayer_set_t{};
  for (uint8_t seed = 1; seed <= anchor::schema::kMaxRelayers; ++seed) {
    anchor::protocol::seed_relayer(set, make_account(seed));
  }
  auto result =
      anchor::protocol::apply_set_relayer(set, grant(make_account(50)), "test");
  EXPECT_TRUE(anchor::protocol::has_error(
      result, transaction_error_code::relayer_limit_reached));
  EXPECT_EQ(result.codespace, "test");
  EXPECT_EQ(set.count, anchor::schema::kMaxRelayers);
}
