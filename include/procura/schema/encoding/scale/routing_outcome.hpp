#pragma once

#include <procura/schema/routing_outcome.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(procura::schema,
                             routing_outcome_t,
                             procura::schema::routing_outcome_t::auto_approved,
                             procura::schema::routing_outcome_t::requires_approval,
                             procura::schema::routing_outcome_t::blocked)
