#include <sentinel/audit/journal.hpp>
#include <sentinel/common/critical.hpp>

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace sentinel::audit {

using sentinel::schema::array_t;
using sentinel::schema::object_t;
using sentinel::schema::value_t;

namespace {

sentinel::schema::timestamp_milliseconds_t now_milliseconds() {
  return static_cast<sentinel::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

value_t to_value(const std::vector<std::string>& items) {
  auto out = array_t{};
  out.reserve(items.size());
  for (const auto& item : items) {
    out.emplace_back(item);
  }
  return value_t{std::move(out)};
}

std::string_view event_name(const sentinel::schema::decision_kind_t kind) {
  return kind == sentinel::schema::decision_kind_t::allow ? "suppressed"
                                                          : "violation";
}

}  // namespace

journal::journal(std::shared_ptr<spdlog::logger> logger,
                 audit_storage_t* store)
    : logger_{std::move(logger)}, store_{store} {
  if (!logger_) {
    sentinel::common::critical("audit journal created without a logger");
  }
  if (store_ != nullptr) {
    next_sequence_ = store_->last_audit_sequence().value_or(0) + 1;
  }
}

std::optional<sentinel::schema::audit_record_t> journal::record(
    const sentinel::execution::evaluation_t& evaluation,
    const sentinel::schema::policy_t& policy,
    const event_context_t& context) {
  const auto* failure = evaluation.failure();
  if (failure == nullptr) {
    return std::nullopt;
  }

  auto entry = sentinel::schema::audit_record_t{};
  entry.sequence = next_sequence_.fetch_add(1);
  entry.recorded_at = now_milliseconds();
  entry.sink_id = evaluation.sink_id;
  entry.decision = sentinel::schema::kind_of(evaluation.decision);
  entry.validator_id = failure->validator_id;
  entry.reason = failure->reason;
  entry.detail = failure->detail;
  entry.mode = evaluation.effective_mode;
  entry.policy_fingerprint = policy.fingerprint();
  entry.taint_tags.assign(std::begin(context.taint_tags),
                          std::end(context.taint_tags));
  entry.taint_flow = context.taint_flow;

  const auto* sink = policy.find_sink(evaluation.sink_id);
  const auto line =
      to_json_line(entry, sink != nullptr ? sink->violation_message
                                          : std::optional<std::string>{});
  if (entry.decision == sentinel::schema::decision_kind_t::allow) {
    logger_->info("{}", line);
  } else {
    logger_->warn("{}", line);
  }

  if (store_ != nullptr) {
    store_->put_audit_record(entry);
  }
  return entry;
}

std::shared_ptr<spdlog::logger> journal::make_stderr_logger() {
  if (auto existing = spdlog::get(std::string{kAuditLoggerName})) {
    return existing;
  }
  auto sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
  auto logger =
      std::make_shared<spdlog::logger>(std::string{kAuditLoggerName}, sink);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

std::string to_json_line(const sentinel::schema::audit_record_t& record,
                         const std::optional<std::string>& message) {
  auto out = object_t{};
  out.emplace_back("ts", static_cast<int64_t>(record.recorded_at));
  out.emplace_back("seq", static_cast<int64_t>(record.sequence));
  out.emplace_back("event", std::string{event_name(record.decision)});
  out.emplace_back("sink", record.sink_id);
  out.emplace_back("decision", std::string{to_string(record.decision)});
  out.emplace_back("validator", record.validator_id);
  out.emplace_back("reason", record.reason ? value_t{std::string{to_string(
                                                 *record.reason)}}
                                           : value_t{});
  out.emplace_back("detail", record.detail);
  out.emplace_back("mode", std::string{to_string(record.mode)});
  if (message) {
    out.emplace_back("message", *message);
  }
  out.emplace_back("taint_tags", to_value(record.taint_tags));
  out.emplace_back("taint_flow", to_value(record.taint_flow));
  out.emplace_back(
      "policy_fingerprint",
      sentinel::schema::to_hex(sentinel::schema::bytes_view_t{
          record.policy_fingerprint.data(), record.policy_fingerprint.size()}));
  return to_json(value_t{std::move(out)});
}

}  // namespace sentinel::audit
