#include <escrow/common/critical.hpp>
#include <escrow/storage/rocksdb/storage.hpp>

namespace escrow::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();
  // Corrupt ledger state must fail the open, not a later read.
  options.paranoid_checks = true;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    escrow::common::critical("Failed to open escrow ledger store at {}: {}",
                             path, status.ToString());
  }
  store.database.reset(database);

  if (auto committed = store.load_committed_state()) {
    spdlog::info("Opened escrow ledger store at {} (height {})", path,
                 committed->height);
  } else {
    spdlog::info("Opened empty escrow ledger store at {}", path);
  }
  return store;
}
}  // namespace escrow::storage
