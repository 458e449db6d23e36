#include <sentinel/validation/string_validator.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace sentinel::validation {

using sentinel::schema::reason_code_t;

validation_result_t evaluate(const sentinel::schema::string_validator_t& spec,
                             const std::string_view text) {
  const auto length = sentinel::schema::utf8_length(text);
  if (spec.max_len && length > *spec.max_len) {
    return validation_result_t::fail(
        reason_code_t::too_long,
        fmt::format("length {} > {}", length, *spec.max_len));
  }
  if (spec.min_len && length < *spec.min_len) {
    return validation_result_t::fail(
        reason_code_t::too_short,
        fmt::format("length {} < {}", length, *spec.min_len));
  }

  if (spec.allowed_charset) {
    auto it = std::find_if(std::begin(text), std::end(text), [&](char c) {
      return !spec.allowed_charset->contains(c);
    });
    if (it != std::end(text)) {
      return validation_result_t::fail(
          reason_code_t::disallowed_char,
          fmt::format("byte 0x{:02x} at offset {} not in [{}]",
                      static_cast<uint8_t>(*it),
                      std::distance(std::begin(text), it),
                      spec.allowed_charset->source));
    }
  }

  for (const auto& denied : spec.deny_substrings) {
    if (text.find(denied) != std::string_view::npos) {
      return validation_result_t::fail(
          reason_code_t::denied_substring,
          fmt::format("contains forbidden substring '{}'", denied));
    }
  }

  if (spec.deny_regex) {
    try {
      if (std::regex_search(std::begin(text), std::end(text),
                            spec.deny_regex->compiled)) {
        return validation_result_t::fail(
            reason_code_t::denied_pattern,
            fmt::format("matches forbidden pattern '{}'",
                        spec.deny_regex->source));
      }
    } catch (const std::regex_error& e) {
      return validation_result_t::fail(
          reason_code_t::denied_pattern,
          fmt::format("regex '{}' aborted: {}", spec.deny_regex->source,
                      e.what()));
    }
  }

  if (spec.regex) {
    try {
      if (!std::regex_match(std::begin(text), std::end(text),
                            spec.regex->compiled)) {
        return validation_result_t::fail(
            reason_code_t::pattern_mismatch,
            fmt::format("does not match '{}'", spec.regex->source));
      }
    } catch (const std::regex_error& e) {
      return validation_result_t::fail(
          reason_code_t::pattern_mismatch,
          fmt::format("regex '{}' aborted: {}", spec.regex->source, e.what()));
    }
  }

  return validation_result_t::pass();
}

}  // namespace sentinel::validation
