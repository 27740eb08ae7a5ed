#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <syndicate/common/critical.hpp>
#include <syndicate/schema/encoding/scale/encoder.hpp>
#include <syndicate/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>
#include <tuple>

namespace syndicate::storage {

namespace detail {

using encoder_t = syndicate::schema::encoding::encoder<
    syndicate::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED"};

inline syndicate::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const syndicate::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const syndicate::schema::bytes_view_t& key) const;

  std::optional<committed_state> load_committed_state() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const syndicate::schema::bytes_view_t& prefix) const;
  void commit(const commit_batch& batch) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const syndicate::schema::bytes_view_t& key) const {
  if (!database) {
    syndicate::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      syndicate::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(syndicate::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    syndicate::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    syndicate::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, syndicate::schema::hash32_t>>(
          syndicate::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    syndicate::common::critical("failed to decode committed state");
  }
  return committed_state{.sequence = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const syndicate::schema::bytes_view_t& prefix) const {
  if (!database) {
    syndicate::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    syndicate::common::critical("failed to iterate RocksDB prefix");
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::commit(
    const commit_batch& batch) const {
  if (!database) {
    syndicate::common::critical("RocksDB database is not initialized");
  }

  auto prefix_string =
      std::string{reinterpret_cast<const char*>(batch.replace_prefix.data()),
                  batch.replace_prefix.size()};
  auto write_batch = ROCKSDB_NAMESPACE::WriteBatch{};

  if (!prefix_string.empty()) {
    auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
        database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
    iterator->Seek(prefix_string);
    while (iterator->Valid()) {
      auto key_view =
          std::string_view{iterator->key().data(), iterator->key().size()};
      if (!key_view.starts_with(prefix_string)) {
        break;
      }
      auto delete_status = write_batch.Delete(iterator->key());
      if (!delete_status.ok()) {
        syndicate::common::critical("failed deleting key during commit");
      }
      iterator->Next();
    }
  }

  auto put_rows = [&](const std::vector<key_value_entry_t>& rows) {
    for (const auto& [key, value] : rows) {
      auto put_status = write_batch.Put(
          detail::to_slice(syndicate::schema::bytes_view_t{key}),
          detail::to_slice(syndicate::schema::bytes_view_t{value}));
      if (!put_status.ok()) {
        syndicate::common::critical("failed writing key during commit");
      }
    }
  };
  put_rows(batch.state);
  put_rows(batch.appends);

  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{batch.checkpoint.sequence, batch.checkpoint.state_root});
  auto checkpoint_status = write_batch.Put(
      std::string{detail::kCommittedStateKey},
      detail::to_slice(syndicate::schema::bytes_view_t{encoded}));
  if (!checkpoint_status.ok()) {
    syndicate::common::critical("failed writing committed checkpoint");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &write_batch);
  if (!write_status.ok()) {
    spdlog::error("RocksDB commit failed: {}", write_status.ToString());
    syndicate::common::critical("failed to commit scheme state");
  }
}

}  // namespace syndicate::storage
