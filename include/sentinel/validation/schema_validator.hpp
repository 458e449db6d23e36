#pragma once

#include <sentinel/schema/validator_spec.hpp>
#include <sentinel/schema/value.hpp>
#include <sentinel/validation/validation_result.hpp>

#include <string_view>

namespace sentinel::validation {

/// Compiles a structured-schema document. Recognised keywords: type,
/// required, properties, additionalProperties (boolean), items, pattern,
/// enum, minimum, maximum, exclusiveMinimum, exclusiveMaximum, minLength,
/// maxLength, minItems, maxItems. Annotation keywords are ignored.
///
/// Throws common::policy_error (invalid_validator_spec).
sentinel::schema::schema_node_t compile_schema(
    const sentinel::schema::value_t& document,
    std::string_view context);

/// Walks `instance` in pre-order and reports the first violation as
/// "<json pointer>: <keyword>". Object members are visited in schema
/// declaration order, array elements in index order.
validation_result_t evaluate(const sentinel::schema::schema_validator_t& spec,
                             const sentinel::schema::value_t& instance);

}  // namespace sentinel::validation
