#pragma once

#include <procura/schema/risk_score.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(procura::schema,
                             risk_score_t,
                             procura::schema::risk_score_t::low,
                             procura::schema::risk_score_t::medium,
                             procura::schema::risk_score_t::high)
