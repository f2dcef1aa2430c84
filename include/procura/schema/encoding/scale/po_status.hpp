#pragma once

#include <procura/schema/po_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(procura::schema,
                             po_status_t,
                             procura::schema::po_status_t::draft,
                             procura::schema::po_status_t::routed,
                             procura::schema::po_status_t::blocked,
                             procura::schema::po_status_t::pending_budget,
                             procura::schema::po_status_t::reserved,
                             procura::schema::po_status_t::awaiting_approval,
                             procura::schema::po_status_t::approved,
                             procura::schema::po_status_t::rejected,
                             procura::schema::po_status_t::consumed,
                             procura::schema::po_status_t::released)
