#pragma once

#include <sentinel/schema/validator_spec.hpp>

#include <cstddef>
#include <string_view>

namespace sentinel::validation {

inline constexpr std::size_t kMaxPatternLength = 1024;

/// Compiles a policy-supplied regular expression after rejecting shapes that
/// can backtrack catastrophically: nested quantifiers such as "(a+)+",
/// backreferences, and sources longer than kMaxPatternLength.
///
/// Throws common::policy_error (invalid_validator_spec); `context` names the
/// offending field in the message.
sentinel::schema::pattern_t compile_pattern(std::string_view source,
                                            std::string_view context);

/// Parses a character-class body ("A-Za-z0-9._-") into a byte set. Supports
/// ranges, backslash escapes and a literal '-' at either edge.
sentinel::schema::charset_t compile_charset(std::string_view source,
                                            std::string_view context);

}  // namespace sentinel::validation
