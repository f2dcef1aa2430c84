#pragma once
#include <procura/schema/line_item.hpp>
#include <procura/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: purchase order request.
// Procurement workflow: submission payload. po_id is generated when absent.
namespace procura::schema {

template <uint16_t Version>
struct purchase_order_request;

template <>
struct purchase_order_request<1> final {
  uint16_t version{1};
  std::optional<po_id_t> po_id;
  department_id_t department_id;
  supplier_id_t supplier_id;
  amount_t amount{};
  std::string requested_by;
  std::vector<line_item_t> items;
};

using purchase_order_request_t = purchase_order_request<1>;

}  // namespace procura::schema
