#pragma once

#include <beacon/schema/intent_side.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(beacon::schema,
                             intent_side_t,
                             beacon::schema::intent_side_t::buy,
                             beacon::schema::intent_side_t::sell)
