#include <syndicate/common/critical.hpp>
#include <syndicate/storage/rocksdb/storage.hpp>

#include <string>
#include <string_view>

namespace {

// A scheme store holds one state keyspace and an append-only event log, so it
// runs with default parallelism and a small write buffer.
ROCKSDB_NAMESPACE::Options scheme_store_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.write_buffer_size = 4 << 20;
  options.max_open_files = 64;
  return options;
}

std::string_view describe_open_failure(const ROCKSDB_NAMESPACE::Status& status) {
  if (status.IsCorruption()) {
    return "scheme store is corrupt";
  }
  if (status.IsIOError()) {
    return "scheme store is unreadable or held by another handle";
  }
  if (status.IsInvalidArgument()) {
    return "scheme store options do not match the stored database";
  }
  return "scheme store could not be opened";
}

}  // namespace

namespace syndicate::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  if (path.empty()) {
    syndicate::common::critical("Scheme store path is empty");
  }
  auto store = storage<rocksdb_storage_tag>();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(scheme_store_options(),
                                            std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Cannot open scheme store at {}: {}", path,
                  status.ToString());
    syndicate::common::critical(describe_open_failure(status));
  }
  store.database.reset(database);

  if (auto committed = store.load_committed_state()) {
    spdlog::info("Opened scheme store at {} at checkpoint {}", path,
                 committed->sequence);
  } else {
    spdlog::info("Created scheme store at {}", path);
  }
  return store;
}
}  // namespace syndicate::storage
