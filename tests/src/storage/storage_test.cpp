#include <gtest/gtest.h>
#include <anchor/schema/encoding/scale/encoder.hpp>
#include <anchor/storage/rocksdb/storage.hpp>
#include <anchor/storage/storage.hpp>
#include <anchor/testing/common.hpp>

#include <optional>
#include <string>
#include <tuple>

namespace {

using storage_t = anchor::storage::storage<anchor::storage::rocksdb_storage_tag>;
using namespace anchor::testing;

anchor::storage::key_value_entry_t make_entry(const std::string_view key,
                                              const std::string_view value) {
  return {anchor::schema::make_bytes(key), anchor::schema::make_bytes(value)};
}

class storage_test : public ::testing::Test {
 protected:
  void SetUp() override { path_ = make_db_path("anchor_storage"); }
  void TearDown() override { remove_path(path_); }

  storage_t open() {
    return anchor::storage::make_storage<anchor::storage::rocksdb_storage_tag>(
        path_);
  }

  std::string path_;
};

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = anchor::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);
  EXPECT_TRUE(anchor::schema::is_zero(committed.state_root));

  auto entry = anchor::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST_F(storage_test, committed_state_survives_reopen) {
  {
    auto storage = open();
    EXPECT_FALSE(storage.load_committed_state().has_value());
    storage.save_committed_state(
        anchor::storage::committed_state{.height = 42,
                                         .state_root = make_hash(10)});
  }
  auto storage = open();
  auto loaded = storage.load_committed_state();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->height, 42);
  EXPECT_EQ(loaded->state_root, make_hash(10));
}

TEST_F(storage_test, batched_values_decode_through_typed_get) {
  auto storage = open();
  auto encoder = scale_encoder_t{};
  auto key = anchor::schema::make_bytes(std::string_view{"UNIT|TEST"});
  auto value = std::tuple{uint64_t{7}, make_hash(3), std::string{"anchor"}};
  storage.write_batch({{key, encoder.encode(value)}});

  auto loaded = storage.get<decltype(value)>(
      encoder, anchor::schema::bytes_view_t{key});
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, value);

  auto missing = anchor::schema::make_bytes(std::string_view{"UNIT|MISSING"});
  EXPECT_FALSE(storage
                   .get<uint64_t>(encoder,
                                  anchor::schema::bytes_view_t{missing})
                   .has_value());
}

TEST_F(storage_test, list_by_prefix_is_scoped_and_ordered) {
  auto storage = open();
  storage.write_batch({make_entry("HIST|b", "2"), make_entry("HIST|a", "1"),
                       make_entry("HISU|z", "x"), make_entry("NONCE|a", "9")});

  auto entries = storage.list_by_prefix(
      anchor::schema::make_bytes_view(std::string_view{"HIST|"}));
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0], make_entry("HIST|a", "1"));
  EXPECT_EQ(entries[1], make_entry("HIST|b", "2"));
}
