#pragma once
#include <procura/schema/primitives.hpp>
#include <procura/schema/reservation_status.hpp>
#include <optional>

// Schema type: reservation state.
// Procurement workflow: budget hold tying a purchase order to a department.
namespace procura::schema {

template <uint16_t Version>
struct reservation_state;

template <>
struct reservation_state<1> final {
  uint16_t version{1};
  reservation_id_t reservation_id;
  po_id_t po_id;
  department_id_t department_id;
  amount_t amount{};
  reservation_status_t status{reservation_status_t::active};
  timestamp_milliseconds_t created_at{};
  std::optional<timestamp_milliseconds_t> settled_at;
};

using reservation_state_t = reservation_state<1>;

}  // namespace procura::schema
