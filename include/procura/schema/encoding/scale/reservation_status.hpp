#pragma once

#include <procura/schema/reservation_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(procura::schema,
                             reservation_status_t,
                             procura::schema::reservation_status_t::active,
                             procura::schema::reservation_status_t::released,
                             procura::schema::reservation_status_t::consumed)
