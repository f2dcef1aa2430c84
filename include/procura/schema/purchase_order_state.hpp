#pragma once
#include <procura/schema/approver_action.hpp>
#include <procura/schema/line_item.hpp>
#include <procura/schema/po_status.hpp>
#include <procura/schema/primitives.hpp>
#include <procura/schema/routing_decision.hpp>
#include <procura/schema/status_change.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: purchase order state.
// Procurement workflow: the orchestrator's record of one order, including
// the routing it was given, its budget hold and every approver action.
namespace procura::schema {

template <uint16_t Version>
struct purchase_order_state;

template <>
struct purchase_order_state<1> final {
  uint16_t version{1};
  po_id_t po_id;
  department_id_t department_id;
  supplier_id_t supplier_id;
  amount_t amount{};
  std::string requested_by;
  std::vector<line_item_t> items;
  po_status_t status{po_status_t::draft};
  std::optional<routing_decision_t> routing;
  std::optional<reservation_id_t> reservation_id;
  std::vector<approver_action_t> actions;  // in arrival order
  std::vector<status_change_t> history;
  std::string reason;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using purchase_order_state_t = purchase_order_state<1>;

}  // namespace procura::schema
