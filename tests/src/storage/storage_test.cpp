#include <gtest/gtest.h>
#include <syndicate/schema/encoding/scale/encoder.hpp>
#include <syndicate/storage/rocksdb/storage.hpp>
#include <syndicate/storage/storage.hpp>
#include <syndicate/testing/common.hpp>

#include <csignal>
#include <fstream>
#include <optional>
#include <string>

namespace {

using storage_t =
    syndicate::storage::storage<syndicate::storage::rocksdb_storage_tag>;
using encoder_t = syndicate::schema::encoding::encoder<
    syndicate::schema::encoding::scale_encoder_tag>;

syndicate::schema::bytes_t key_of(const std::string_view key) {
  return syndicate::schema::make_bytes(key);
}

}  // namespace

TEST(storage, defaults_are_stable) {
  auto committed = syndicate::storage::committed_state{};
  EXPECT_EQ(committed.sequence, 0u);
  EXPECT_EQ(committed.state_root, syndicate::schema::hash32_t{});

  auto batch = syndicate::storage::commit_batch{};
  EXPECT_TRUE(batch.replace_prefix.empty());
  EXPECT_TRUE(batch.state.empty());
  EXPECT_TRUE(batch.appends.empty());
}

TEST(storage, fresh_database_has_no_checkpoint) {
  auto db = syndicate::testing::make_db_path("syndicate_storage_fresh");
  {
    auto storage =
        syndicate::storage::make_storage<syndicate::storage::rocksdb_storage_tag>(
            db);
    EXPECT_FALSE(storage.load_committed_state().has_value());
    auto encoder = encoder_t{};
    EXPECT_FALSE((storage.get<encoder_t, uint64_t>(
                      encoder, syndicate::schema::make_bytes_view(
                                   std::string_view{"missing"})))
                     .has_value());
  }
  syndicate::testing::remove_path(db);
}

TEST(storage, commit_persists_rows_and_checkpoint) {
  auto db = syndicate::testing::make_db_path("syndicate_storage_commit");
  {
    auto storage =
        syndicate::storage::make_storage<syndicate::storage::rocksdb_storage_tag>(
            db);
    auto encoder = encoder_t{};
    auto batch = syndicate::storage::commit_batch{};
    batch.replace_prefix = key_of("S|");
    batch.state.push_back({key_of("S|a"), encoder.encode(uint64_t{1})});
    batch.appends.push_back({key_of("E|0"), encoder.encode(uint64_t{7})});
    batch.checkpoint = syndicate::storage::committed_state{
        .sequence = 3, .state_root = syndicate::testing::make_hash(10)};
    storage.commit(batch);

    auto committed = storage.load_committed_state();
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->sequence, 3u);
    EXPECT_EQ(committed->state_root, syndicate::testing::make_hash(10));

    auto value = storage.get<encoder_t, uint64_t>(
        encoder, syndicate::schema::make_bytes_view(std::string_view{"S|a"}));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 1u);
  }
  syndicate::testing::remove_path(db);
}

TEST(storage, commit_replaces_prefix_and_keeps_appends) {
  auto db = syndicate::testing::make_db_path("syndicate_storage_prefix");
  {
    auto storage =
        syndicate::storage::make_storage<syndicate::storage::rocksdb_storage_tag>(
            db);
    auto encoder = encoder_t{};

    auto first = syndicate::storage::commit_batch{};
    first.replace_prefix = key_of("S|");
    first.state.push_back({key_of("S|one"), encoder.encode(uint64_t{1})});
    first.state.push_back({key_of("S|two"), encoder.encode(uint64_t{2})});
    first.appends.push_back({key_of("E|0"), encoder.encode(uint64_t{100})});
    first.checkpoint.sequence = 0;
    storage.commit(first);

    auto second = syndicate::storage::commit_batch{};
    second.replace_prefix = key_of("S|");
    second.state.push_back({key_of("S|three"), encoder.encode(uint64_t{3})});
    second.appends.push_back({key_of("E|1"), encoder.encode(uint64_t{101})});
    second.checkpoint.sequence = 1;
    storage.commit(second);

    auto state_rows = storage.list_by_prefix(
        syndicate::schema::make_bytes_view(std::string_view{"S|"}));
    ASSERT_EQ(state_rows.size(), 1u);
    EXPECT_EQ(state_rows[0].first, key_of("S|three"));
    EXPECT_EQ(encoder.decode<uint64_t>(
                  syndicate::schema::bytes_view_t{state_rows[0].second}),
              3u);

    auto event_rows = storage.list_by_prefix(
        syndicate::schema::make_bytes_view(std::string_view{"E|"}));
    ASSERT_EQ(event_rows.size(), 2u);
    EXPECT_EQ(event_rows[0].first, key_of("E|0"));
    EXPECT_EQ(event_rows[1].first, key_of("E|1"));
    EXPECT_EQ(storage.load_committed_state()->sequence, 1u);
  }
  syndicate::testing::remove_path(db);
}

TEST(storage, reopened_database_keeps_committed_rows) {
  auto db = syndicate::testing::make_db_path("syndicate_storage_reopen");
  {
    auto storage =
        syndicate::storage::make_storage<syndicate::storage::rocksdb_storage_tag>(
            db);
    auto encoder = encoder_t{};
    auto batch = syndicate::storage::commit_batch{};
    batch.replace_prefix = key_of("S|");
    batch.state.push_back({key_of("S|kept"), encoder.encode(uint64_t{42})});
    batch.checkpoint = syndicate::storage::committed_state{
        .sequence = 9, .state_root = syndicate::testing::make_hash(90)};
    storage.commit(batch);
  }
  {
    auto storage =
        syndicate::storage::make_storage<syndicate::storage::rocksdb_storage_tag>(
            db);
    auto encoder = encoder_t{};
    auto committed = storage.load_committed_state();
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->sequence, 9u);
    EXPECT_EQ(committed->state_root, syndicate::testing::make_hash(90));
    auto value = storage.get<encoder_t, uint64_t>(
        encoder, syndicate::schema::make_bytes_view(std::string_view{"S|kept"}));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42u);
  }
  syndicate::testing::remove_path(db);
}

TEST(storage_death, empty_path_is_fatal) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  EXPECT_EXIT(
      (void)syndicate::storage::make_storage<
          syndicate::storage::rocksdb_storage_tag>(std::string_view{}),
      ::testing::KilledBySignal(SIGTERM), "");
}

TEST(storage_death, path_naming_a_file_is_fatal) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  auto path = syndicate::testing::make_db_path("syndicate_storage_file");
  {
    auto file = std::ofstream{path};
    file << "not a database";
  }
  EXPECT_EXIT(
      (void)syndicate::storage::make_storage<
          syndicate::storage::rocksdb_storage_tag>(path),
      ::testing::KilledBySignal(SIGTERM), "");
  syndicate::testing::remove_path(path);
}
