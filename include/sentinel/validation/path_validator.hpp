#pragma once

#include <sentinel/schema/validator_spec.hpp>
#include <sentinel/validation/validation_result.hpp>

#include <string_view>

namespace sentinel::validation {

validation_result_t evaluate(const sentinel::schema::path_validator_t& spec,
                             std::string_view path);

}  // namespace sentinel::validation
