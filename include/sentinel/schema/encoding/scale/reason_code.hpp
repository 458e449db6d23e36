#pragma once

#include <sentinel/schema/reason_code.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    reason_code_t,
    sentinel::schema::reason_code_t::too_long,
    sentinel::schema::reason_code_t::disallowed_char,
    sentinel::schema::reason_code_t::pattern_mismatch,
    sentinel::schema::reason_code_t::denied_substring,
    sentinel::schema::reason_code_t::path_escape,
    sentinel::schema::reason_code_t::subdirectory_not_allowed,
    sentinel::schema::reason_code_t::schema_violation,
    sentinel::schema::reason_code_t::too_short,
    sentinel::schema::reason_code_t::denied_pattern,
    sentinel::schema::reason_code_t::type_mismatch)
