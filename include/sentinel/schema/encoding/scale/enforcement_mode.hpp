#pragma once

#include <sentinel/schema/enforcement_mode.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    enforcement_mode_t,
    sentinel::schema::enforcement_mode_t::block,
    sentinel::schema::enforcement_mode_t::warn,
    sentinel::schema::enforcement_mode_t::allow)
