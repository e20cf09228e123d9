#include <beacon/common/critical.hpp>
#include <beacon/storage/rocksdb/storage.hpp>

namespace {

ROCKSDB_NAMESPACE::Options make_registry_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  // Index scans rely on bytewise key order; keep the default comparator and
  // table format.
  options.IncreaseParallelism();
  return options;
}

std::unique_ptr<ROCKSDB_NAMESPACE::DB> open_database(
    const std::string_view& path) {
  ROCKSDB_NAMESPACE::DB* raw{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(make_registry_options(), std::string{path}, &raw);
  if (!status.ok()) {
    beacon::common::critical("Cannot open registry store at {}: {}", path,
                             status.ToString());
  }
  return std::unique_ptr<ROCKSDB_NAMESPACE::DB>{raw};
}

}  // namespace

namespace beacon::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>{};
  store.database = open_database(path);
  spdlog::info("Registry store open at {}", path);
  return store;
}

}  // namespace beacon::storage
