#pragma once
#include <syndicate/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace syndicate::storage {

using key_value_entry_t =
    std::pair<syndicate::schema::bytes_t, syndicate::schema::bytes_t>;

/// Last committed operation checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t sequence{};
  syndicate::schema::hash32_t state_root{};
};

/// One atomic unit of persisted change.
///
/// Every row under `replace_prefix` is dropped and replaced with `state`;
/// `appends` are written as-is and the checkpoint is advanced, all in one
/// write.
struct commit_batch final {
  syndicate::schema::bytes_t replace_prefix;
  std::vector<key_value_entry_t> state;
  std::vector<key_value_entry_t> appends;
  committed_state checkpoint;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const syndicate::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const syndicate::schema::bytes_view_t& prefix) const;

  /// Apply a commit batch atomically.
  void commit(const commit_batch& batch) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace syndicate::storage
