#pragma once

#include <procura/schema/approval_decision.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(procura::schema,
                             approval_decision_t,
                             procura::schema::approval_decision_t::approve,
                             procura::schema::approval_decision_t::reject)
