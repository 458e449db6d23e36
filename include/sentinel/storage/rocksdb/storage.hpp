#pragma once
#include <boost/endian/buffers.hpp>
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <sentinel/common/critical.hpp>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/storage/storage.hpp>
#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

namespace sentinel::storage {

namespace detail {

using encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;

inline constexpr auto kAuditPrefix = std::string_view{"AUDIT|"};

/// "AUDIT|" + big-endian sequence, so lexicographic order is numeric order.
inline std::string make_audit_key(const uint64_t sequence) {
  auto encoded = boost::endian::big_uint64_buf_t{sequence};
  auto key = std::string{kAuditPrefix};
  key.append(reinterpret_cast<const char*>(encoded.data()),
             sizeof(encoded));
  return key;
}

inline std::optional<uint64_t> parse_audit_key(const std::string_view key) {
  if (!key.starts_with(kAuditPrefix) ||
      key.size() != kAuditPrefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  auto decoded = boost::endian::big_uint64_buf_t{};
  std::memcpy(decoded.data(), key.data() + kAuditPrefix.size(),
              sizeof(decoded));
  return decoded.value();
}

inline sentinel::schema::bytes_view_t to_bytes_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  void put_audit_record(const sentinel::schema::audit_record_t& record) const;
  std::vector<sentinel::schema::audit_record_t> list_audit_records() const;
  std::optional<uint64_t> last_audit_sequence() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline void storage<rocksdb_storage_tag>::put_audit_record(
    const sentinel::schema::audit_record_t& record) const {
  if (!database) {
    sentinel::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(record);
  auto key = detail::make_audit_key(record.sequence);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, key,
      ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(encoded.data()),
                               encoded.size()});
  if (!status.ok()) {
    spdlog::error("Failed to put audit record {} into RocksDB: {}",
                  record.sequence, status.ToString());
    sentinel::common::critical("failed to persist audit record");
  }
}

inline std::vector<sentinel::schema::audit_record_t>
storage<rocksdb_storage_tag>::list_audit_records() const {
  if (!database) {
    sentinel::common::critical("RocksDB database is not initialized");
  }
  auto records = std::vector<sentinel::schema::audit_record_t>{};
  auto encoder = detail::encoder_t{};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(std::string{detail::kAuditPrefix}); iterator->Valid();
       iterator->Next()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(detail::kAuditPrefix)) {
      break;
    }
    auto decoded = encoder.try_decode<sentinel::schema::audit_record_t>(
        detail::to_bytes_view(iterator->value()));
    if (!decoded) {
      spdlog::warn("Failed decoding audit record at sequence {}",
                   detail::parse_audit_key(key_view).value_or(0));
      continue;
    }
    records.push_back(std::move(*decoded));
  }
  if (!iterator->status().ok()) {
    spdlog::error("Audit iteration failed: {}", iterator->status().ToString());
    sentinel::common::critical("failed to read audit records");
  }
  return records;
}

inline std::optional<uint64_t>
storage<rocksdb_storage_tag>::last_audit_sequence() const {
  if (!database) {
    sentinel::common::critical("RocksDB database is not initialized");
  }
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->SeekForPrev(
      detail::make_audit_key(std::numeric_limits<uint64_t>::max()));
  if (!iterator->Valid()) {
    return std::nullopt;
  }
  return detail::parse_audit_key(
      std::string_view{iterator->key().data(), iterator->key().size()});
}

}  // namespace sentinel::storage
