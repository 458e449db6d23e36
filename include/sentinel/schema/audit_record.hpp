#pragma once

#include <sentinel/schema/decision.hpp>
#include <sentinel/schema/enforcement_mode.hpp>
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/reason_code.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sentinel::schema {

template <uint16_t Version>
struct audit_record;

/// One persisted decision. Allow decisions are only persisted when a failure
/// was suppressed by an allow-mode sink.
template <>
struct audit_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  timestamp_milliseconds_t recorded_at{};
  sink_id_t sink_id;
  decision_kind_t decision{};
  validator_id_t validator_id;
  std::optional<reason_code_t> reason;
  std::string detail;
  enforcement_mode_t mode{};
  hash32_t policy_fingerprint{};
  std::vector<std::string> taint_tags;
  std::vector<std::string> taint_flow;
};

using audit_record_t = audit_record<1>;

}  // namespace sentinel::schema
