#pragma once
#include <procura/schema/po_status.hpp>
#include <procura/schema/primitives.hpp>

namespace procura::schema {

template <uint16_t Version>
struct status_change;

template <>
struct status_change<1> final {
  uint16_t version{1};
  po_status_t from{po_status_t::draft};
  po_status_t to{po_status_t::draft};
  timestamp_milliseconds_t changed_at{};
};

using status_change_t = status_change<1>;

}  // namespace procura::schema
