#pragma once

#include <sentinel/execution/engine.hpp>
#include <sentinel/schema/audit_record.hpp>
#include <sentinel/schema/policy.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <sentinel/taint/tainted.hpp>

#include <spdlog/logger.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel::audit {

using audit_storage_t =
    sentinel::storage::storage<sentinel::storage::rocksdb_storage_tag>;

inline constexpr auto kAuditLoggerName = std::string_view{"audit"};

/// Provenance attached to an event: tags of the tainted input and the flow
/// trail that led to the sink.
struct event_context_t final {
  sentinel::taint::tag_set_t taint_tags;
  std::vector<std::string> taint_flow;
};

/// Structured record of every decision that is not a clean allow.
///
/// Each event becomes one JSON object per line on the audit logger and, when
/// a store is attached, one persisted audit_record<1>. Safe to share across
/// threads.
class journal final {
 public:
  /// `store` is optional and must outlive the journal. Sequence numbers
  /// continue after the highest one already in the store.
  explicit journal(std::shared_ptr<spdlog::logger> logger,
                   audit_storage_t* store = nullptr);

  /// Returns the record written, or std::nullopt when the evaluation was a
  /// clean allow and nothing was recorded.
  std::optional<sentinel::schema::audit_record_t> record(
      const sentinel::execution::evaluation_t& evaluation,
      const sentinel::schema::policy_t& policy,
      const event_context_t& context = {});

  /// Logger named "audit" writing bare JSON lines to stderr.
  static std::shared_ptr<spdlog::logger> make_stderr_logger();

 private:
  std::shared_ptr<spdlog::logger> logger_;
  audit_storage_t* store_{nullptr};
  std::atomic<uint64_t> next_sequence_{1};
};

/// {"ts":...,"event":"violation","sink":...,"validator":...,"reason":...,
///  "detail":...,"mode":...,"decision":...,"taint_tags":[...],
///  "taint_flow":[...],"policy_fingerprint":"..."} plus "message" when the
/// sink declares one.
std::string to_json_line(const sentinel::schema::audit_record_t& record,
                         const std::optional<std::string>& message = {});

}  // namespace sentinel::audit
