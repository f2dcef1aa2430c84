#pragma once

#include <procura/schema/supplier_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(procura::schema,
                             supplier_status_t,
                             procura::schema::supplier_status_t::approved,
                             procura::schema::supplier_status_t::pending,
                             procura::schema::supplier_status_t::suspended)
