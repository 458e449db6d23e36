#pragma once

#include <sentinel/schema/validator_spec.hpp>
#include <sentinel/schema/value.hpp>
#include <sentinel/validation/path_validator.hpp>
#include <sentinel/validation/schema_validator.hpp>
#include <sentinel/validation/string_validator.hpp>
#include <sentinel/validation/validation_result.hpp>

#include <string_view>

namespace sentinel::validation {

/// Applies one catalog entry to one value.
///
/// String and path validators accept string values only; schema validators
/// accept object or array roots. Any other shape throws
/// common::evaluation_error naming `validator_id`. A shape mismatch is never
/// reported as a pass or a policy failure.
validation_result_t evaluate(std::string_view validator_id,
                             const sentinel::schema::validator_spec_t& spec,
                             const sentinel::schema::value_t& value);

}  // namespace sentinel::validation
