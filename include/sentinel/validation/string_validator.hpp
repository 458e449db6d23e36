#pragma once

#include <sentinel/schema/validator_spec.hpp>
#include <sentinel/validation/validation_result.hpp>

#include <string_view>

namespace sentinel::validation {

/// Checks run in a fixed order and the first failure wins: max length, min
/// length, charset, denied substrings, denied pattern, full-match regex.
/// Denials precede the full-match regex so "../x" reports the substring it
/// contains rather than a pattern mismatch. Lengths count code points; the
/// charset is checked per byte.
validation_result_t evaluate(const sentinel::schema::string_validator_t& spec,
                             std::string_view text);

}  // namespace sentinel::validation
