#include <escrow/schema/encoding/scale/encoder.hpp>
#include <escrow/storage/rocksdb/storage.hpp>
#include <escrow/storage/storage.hpp>
#include <escrow/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t =
    escrow::schema::encoding::encoder<escrow::schema::encoding::scale_encoder_tag>;

escrow::schema::bytes_view_t view(const escrow::schema::bytes_t& bytes) {
  return escrow::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = escrow::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);
  EXPECT_EQ(committed.state_root, escrow::schema::hash32_t{});

  auto entry = escrow::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, fresh_store_has_no_checkpoint) {
  auto db = escrow::testing::make_db_path("escrow_storage_fresh");
  {
    auto storage =
        escrow::storage::make_storage<escrow::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());
    auto missing = escrow::testing::make_key("missing");
    EXPECT_FALSE(storage.get_raw(view(missing)).has_value());
  }
  escrow::testing::remove_path(db);
}

TEST(storage_types, commit_writes_entries_with_checkpoint) {
  auto db = escrow::testing::make_db_path("escrow_storage_commit");
  {
    auto storage =
        escrow::storage::make_storage<escrow::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = escrow::testing::make_key("JOB|1");
    auto entries = std::vector<escrow::storage::key_value_entry_t>{
        {key, encoder.encode(uint64_t{77})}};
    auto state = escrow::storage::committed_state{
        .height = 42, .state_root = escrow::testing::make_hash(10)};
    storage.commit(entries, state);

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, state.height);
    EXPECT_EQ(loaded->state_root, state.state_root);

    auto value = storage.get<uint64_t>(encoder, view(key));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 77u);
  }
  escrow::testing::remove_path(db);
}

TEST(storage_types, checkpoint_survives_reopen) {
  auto db = escrow::testing::make_db_path("escrow_storage_reopen");
  auto root = escrow::testing::make_hash(3);
  {
    auto storage =
        escrow::storage::make_storage<escrow::storage::rocksdb_storage_tag>(db);
    storage.commit({}, escrow::storage::committed_state{.height = 5,
                                                        .state_root = root});
  }
  {
    auto storage =
        escrow::storage::make_storage<escrow::storage::rocksdb_storage_tag>(db);
    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, 5);
    EXPECT_EQ(loaded->state_root, root);
  }
  escrow::testing::remove_path(db);
}
