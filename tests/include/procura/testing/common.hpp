#pragma once

#include <procura/schema/approval_rule.hpp>
#include <procura/schema/approver_state.hpp>
#include <procura/schema/budget_state.hpp>
#include <procura/schema/encoding/scale/encoder.hpp>
#include <procura/schema/primitives.hpp>
#include <procura/schema/purchase_order_request.hpp>
#include <procura/schema/supplier_state.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace procura::testing {

using scale_encoder_t = procura::schema::encoding::encoder<
    procura::schema::encoding::scale_encoder_tag>;

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = uint64_t{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(++counter));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline procura::schema::supplier_state_t make_supplier(
    const std::string_view id,
    const procura::schema::supplier_status_t status,
    const procura::schema::risk_score_t risk,
    const procura::schema::amount_t max_order_value) {
  auto supplier = procura::schema::supplier_state_t{};
  supplier.supplier_id = std::string{id};
  supplier.name = std::string{id} + " Ltd";
  supplier.status = status;
  supplier.rating_hundredths = 450;
  supplier.risk_score = risk;
  supplier.max_order_value = max_order_value;
  supplier.payment_terms = "Net 30";
  supplier.contact_email = "orders@" + std::string{id} + ".example";
  supplier.categories = {"office"};
  return supplier;
}

inline procura::schema::budget_state_t make_budget(
    const std::string_view department_id,
    const procura::schema::amount_t allocated,
    const procura::schema::amount_t spent = 0,
    const procura::schema::amount_t reserved = 0,
    const uint16_t fiscal_year = 2025) {
  auto budget = procura::schema::budget_state_t{};
  budget.department_id = std::string{department_id};
  budget.name = std::string{department_id};
  budget.allocated = allocated;
  budget.spent = spent;
  budget.reserved = reserved;
  budget.fiscal_year = fiscal_year;
  budget.manager_email = "manager@procura.example";
  return budget;
}

inline procura::schema::approval_rule_t make_rule(
    const procura::schema::rule_id_t rule_id,
    const procura::schema::amount_t max_amount,
    std::vector<procura::schema::approver_role_t> approvers,
    const bool auto_approve = false) {
  auto rule = procura::schema::approval_rule_t{};
  rule.rule_id = rule_id;
  rule.max_amount = max_amount;
  rule.required_approvers = std::move(approvers);
  rule.auto_approve = auto_approve;
  rule.active = true;
  rule.description = "bracket " + std::to_string(rule_id);
  return rule;
}

inline procura::schema::approver_state_t make_approver(
    const std::string_view role,
    const bool active = true) {
  auto approver = procura::schema::approver_state_t{};
  approver.role = std::string{role};
  approver.name = std::string{role};
  approver.email = std::string{role} + "@procura.example";
  approver.department = "finance";
  approver.active = active;
  return approver;
}

inline procura::schema::purchase_order_request_t make_request(
    const std::string_view po_id,
    const std::string_view department_id,
    const std::string_view supplier_id,
    const procura::schema::amount_t amount) {
  auto request = procura::schema::purchase_order_request_t{};
  request.po_id = std::string{po_id};
  request.department_id = std::string{department_id};
  request.supplier_id = std::string{supplier_id};
  request.amount = amount;
  request.requested_by = "requester@procura.example";
  request.items = {procura::schema::line_item_t{
      .description = "widgets", .quantity = 1, .unit_price = amount}};
  return request;
}

}  // namespace procura::testing
