#pragma once

#include <sentinel/schema/decision.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(sentinel::schema,
                             decision_kind_t,
                             sentinel::schema::decision_kind_t::allow,
                             sentinel::schema::decision_kind_t::block,
                             sentinel::schema::decision_kind_t::warn)
