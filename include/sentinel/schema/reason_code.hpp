#pragma once

#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: reason code.
// Stable taxonomy attached to block/warn decisions. Values are only ever
// appended; adapters may persist and compare them.
namespace sentinel::schema {

enum class reason_code_t : uint16_t {
  too_long = 1,
  disallowed_char = 2,
  pattern_mismatch = 3,
  denied_substring = 4,
  path_escape = 5,
  subdirectory_not_allowed = 6,
  schema_violation = 7,
  too_short = 8,
  denied_pattern = 9,
  type_mismatch = 10,
};

inline constexpr auto kReasonCodeMappings = std::array{
    std::pair<std::string_view, reason_code_t>{"too_long",
                                               reason_code_t::too_long},
    std::pair<std::string_view, reason_code_t>{"disallowed_char",
                                               reason_code_t::disallowed_char},
    std::pair<std::string_view, reason_code_t>{
        "pattern_mismatch", reason_code_t::pattern_mismatch},
    std::pair<std::string_view, reason_code_t>{
        "denied_substring", reason_code_t::denied_substring},
    std::pair<std::string_view, reason_code_t>{"path_escape",
                                               reason_code_t::path_escape},
    std::pair<std::string_view, reason_code_t>{
        "subdirectory_not_allowed", reason_code_t::subdirectory_not_allowed},
    std::pair<std::string_view, reason_code_t>{
        "schema_violation", reason_code_t::schema_violation},
    std::pair<std::string_view, reason_code_t>{"too_short",
                                               reason_code_t::too_short},
    std::pair<std::string_view, reason_code_t>{"denied_pattern",
                                               reason_code_t::denied_pattern},
    std::pair<std::string_view, reason_code_t>{"type_mismatch",
                                               reason_code_t::type_mismatch}};

template <>
inline std::optional<reason_code_t> try_from_string<reason_code_t>(
    const std::string_view value) {
  return from_string(value, kReasonCodeMappings);
}

inline constexpr std::string_view to_string(const reason_code_t value) {
  return to_string(value, kReasonCodeMappings).value_or("unknown");
}

}  // namespace sentinel::schema
