#include <sentinel/common/critical.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <system_error>

namespace sentinel::storage {

namespace {

ROCKSDB_NAMESPACE::Options make_audit_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  // One small record per event.
  options.OptimizeForSmallDb();
  options.keep_log_file_num = 4;
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  const auto location = std::filesystem::path{path};
  if (location.has_parent_path()) {
    auto ec = std::error_code{};
    std::filesystem::create_directories(location.parent_path(), ec);
    if (ec) {
      sentinel::common::critical("cannot create audit directory {}: {}",
                                 location.parent_path().string(),
                                 ec.message());
    }
  }

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  const auto status = ROCKSDB_NAMESPACE::DB::Open(
      make_audit_options(), location.string(), &database);
  if (!status.ok()) {
    sentinel::common::critical("cannot open audit store at {}: {}",
                               location.string(), status.ToString());
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  spdlog::debug("audit store {} opened, last sequence {}", location.string(),
                store.last_audit_sequence().value_or(0));
  return store;
}

}  // namespace sentinel::storage
