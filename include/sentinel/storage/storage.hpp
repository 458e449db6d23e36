#pragma once
#include <sentinel/schema/audit_record.hpp>
#include <sentinel/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace sentinel::storage {

/// Durable, append-only home of persisted audit records, selected at build
/// time by tag.
template <typename Library>
struct storage {
  /// Persist `record` under its sequence number.
  void put_audit_record(const sentinel::schema::audit_record_t& record) const;

  /// All persisted records in sequence order.
  std::vector<sentinel::schema::audit_record_t> list_audit_records() const;

  /// Highest persisted sequence, or std::nullopt for an empty journal.
  std::optional<uint64_t> last_audit_sequence() const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace sentinel::storage
