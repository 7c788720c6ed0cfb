#include <benefactor/common/critical.hpp>
#include <benefactor/storage/rocksdb/storage.hpp>

namespace benefactor::storage {

namespace {

// Ledger writes are small batches keyed by short prefixes; reads are point
// lookups plus prefix scans over the donation indexes.
ROCKSDB_NAMESPACE::Options make_ledger_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  ROCKSDB_NAMESPACE::DB* handle{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(make_ledger_options(),
                                            std::string{path}, &handle);
  if (!status.ok()) {
    spdlog::error("Cannot open ledger database {}: {}", path,
                  status.ToString());
    benefactor::common::critical("ledger database unavailable");
  }

  auto ledger = storage<rocksdb_storage_tag>{};
  ledger.database.reset(handle);
  if (auto committed = ledger.load_committed_state()) {
    spdlog::info("Opened ledger database {} at sequence {}", path,
                 committed->sequence);
  } else {
    spdlog::info("Opened empty ledger database {}", path);
  }
  return ledger;
}

}  // namespace benefactor::storage
