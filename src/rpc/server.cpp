#include <spdlog/spdlog.h>
#include <procura/common/invariant_violation.hpp>
#include <procura/rpc/server.hpp>

using namespace procura::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_internal(
    grpc::CallbackServerContext* context,
    const procura::common::invariant_violation& violation) {
  spdlog::error("Invariant violation: {}", violation.what());
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{grpc::StatusCode::INTERNAL, violation.what()});
  return reactor;
}

procura::v1::ResultCode map_code(const result_code_t code) {
  switch (code) {
    case result_code_t::ok:
      return procura::v1::RESULT_CODE_OK;
    case result_code_t::not_found:
      return procura::v1::RESULT_CODE_NOT_FOUND;
    case result_code_t::blocked:
      return procura::v1::RESULT_CODE_BLOCKED;
    case result_code_t::insufficient_budget:
      return procura::v1::RESULT_CODE_INSUFFICIENT_BUDGET;
    case result_code_t::already_terminal:
      return procura::v1::RESULT_CODE_ALREADY_TERMINAL;
    case result_code_t::invalid_transition:
      return procura::v1::RESULT_CODE_INVALID_TRANSITION;
    case result_code_t::invalid_request:
      return procura::v1::RESULT_CODE_INVALID_REQUEST;
    case result_code_t::role_not_required:
      return procura::v1::RESULT_CODE_ROLE_NOT_REQUIRED;
    case result_code_t::approver_inactive:
      return procura::v1::RESULT_CODE_APPROVER_INACTIVE;
  }
  return procura::v1::RESULT_CODE_INVALID_REQUEST;
}

void fill_line_item(const line_item_t& item, procura::v1::LineItem* out) {
  out->set_description(item.description);
  out->set_quantity(item.quantity);
  out->set_unit_price(item.unit_price);
}

void fill_routing(const routing_decision_t& decision,
                  procura::v1::RoutingDecision* out) {
  out->set_outcome(std::string{to_string(decision.outcome)});
  for (const auto& role : decision.required_roles) {
    out->add_required_roles(role);
  }
  out->set_escalated(decision.escalated);
  out->set_has_rule_id(decision.rule_id.has_value());
  out->set_rule_id(decision.rule_id.value_or(0));
  out->set_reason(decision.reason);
}

void fill_order(const purchase_order_state_t& order,
                procura::v1::PurchaseOrder* out) {
  out->set_po_id(order.po_id);
  out->set_department_id(order.department_id);
  out->set_supplier_id(order.supplier_id);
  out->set_amount(order.amount);
  out->set_requested_by(order.requested_by);
  for (const auto& item : order.items) {
    fill_line_item(item, out->add_items());
  }
  out->set_status(std::string{to_string(order.status)});
  if (order.routing) {
    fill_routing(*order.routing, out->mutable_routing());
  }
  out->set_reservation_id(order.reservation_id.value_or(""));
  for (const auto& action : order.actions) {
    auto* entry = out->add_actions();
    entry->set_role(action.role);
    entry->set_decision(std::string{to_string(action.decision)});
    entry->set_recorded_at(action.recorded_at);
  }
  for (const auto& change : order.history) {
    auto* entry = out->add_history();
    entry->set_from(std::string{to_string(change.from)});
    entry->set_to(std::string{to_string(change.to)});
    entry->set_changed_at(change.changed_at);
  }
  out->set_reason(order.reason);
  out->set_created_at(order.created_at);
  out->set_updated_at(order.updated_at);
}

void fill_response(const procura::orchestration::order_result& result,
                   procura::v1::OrderResponse* response) {
  response->set_code(map_code(result.code));
  response->set_log(result.log);
  response->set_codespace(result.codespace);
  if (result.order) {
    fill_order(*result.order, response->mutable_order());
  }
}

}  // namespace

namespace procura::rpc {

listener::listener(procura::orchestration::orchestrator& orchestrator,
                   const procura::routing::approval_router& router,
                   const procura::budget::budget_ledger& ledger,
                   const procura::supplier::supplier_registry& suppliers,
                   const procura::policy::policy_store& policy)
    : orchestrator_{orchestrator},
      router_{router},
      ledger_{ledger},
      suppliers_{suppliers},
      policy_{policy} {}

grpc::ServerUnaryReactor* listener::SubmitPurchaseOrder(
    grpc::CallbackServerContext* context,
    const procura::v1::SubmitPurchaseOrderRequest* request,
    procura::v1::OrderResponse* response) {
  auto submission = purchase_order_request_t{};
  if (!request->po_id().empty()) {
    submission.po_id = request->po_id();
  }
  submission.department_id = request->department_id();
  submission.supplier_id = request->supplier_id();
  submission.amount = request->amount();
  submission.requested_by = request->requested_by();
  for (const auto& item : request->items()) {
    submission.items.push_back(line_item_t{.description = item.description(),
                                           .quantity = item.quantity(),
                                           .unit_price = item.unit_price()});
  }
  try {
    fill_response(orchestrator_.submit(submission), response);
  } catch (const procura::common::invariant_violation& violation) {
    return finish_internal(context, violation);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RecordApproverAction(
    grpc::CallbackServerContext* context,
    const procura::v1::RecordApproverActionRequest* request,
    procura::v1::OrderResponse* response) {
  auto decision = approval_decision_t{};
  switch (request->decision()) {
    case procura::v1::DECISION_APPROVE:
      decision = approval_decision_t::approve;
      break;
    case procura::v1::DECISION_REJECT:
      decision = approval_decision_t::reject;
      break;
    default:
      response->set_code(procura::v1::RESULT_CODE_INVALID_REQUEST);
      response->set_log("decision must be approve or reject");
      response->set_codespace("procura.action");
      return finish_ok(context);
  }
  try {
    fill_response(
        orchestrator_.record_action(request->po_id(), request->role(), decision),
        response);
  } catch (const procura::common::invariant_violation& violation) {
    return finish_internal(context, violation);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CancelPurchaseOrder(
    grpc::CallbackServerContext* context,
    const procura::v1::CancelPurchaseOrderRequest* request,
    procura::v1::OrderResponse* response) {
  try {
    fill_response(orchestrator_.cancel(request->po_id(), request->reason()),
                  response);
  } catch (const procura::common::invariant_violation& violation) {
    return finish_internal(context, violation);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RetryReservation(
    grpc::CallbackServerContext* context,
    const procura::v1::RetryReservationRequest* request,
    procura::v1::OrderResponse* response) {
  try {
    fill_response(orchestrator_.retry_reservation(request->po_id()), response);
  } catch (const procura::common::invariant_violation& violation) {
    return finish_internal(context, violation);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetPurchaseOrder(
    grpc::CallbackServerContext* context,
    const procura::v1::GetPurchaseOrderRequest* request,
    procura::v1::OrderResponse* response) {
  response->set_codespace("procura.query");
  auto order = orchestrator_.find(request->po_id());
  if (!order) {
    response->set_code(procura::v1::RESULT_CODE_NOT_FOUND);
    response->set_log("order not found");
    return finish_ok(context);
  }
  response->set_code(procura::v1::RESULT_CODE_OK);
  fill_order(*order, response->mutable_order());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RoutePurchaseOrder(
    grpc::CallbackServerContext* context,
    const procura::v1::RoutePurchaseOrderRequest* request,
    procura::v1::RoutePurchaseOrderResponse* response) {
  auto routed = router_.route(request->supplier_id(), request->amount(),
                              now_milliseconds());
  response->set_code(map_code(routed.code));
  response->set_log(routed.log);
  if (routed.decision) {
    fill_routing(*routed.decision, response->mutable_decision());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckBudgetAvailability(
    grpc::CallbackServerContext* context,
    const procura::v1::CheckBudgetAvailabilityRequest* request,
    procura::v1::CheckBudgetAvailabilityResponse* response) {
  try {
    auto availability =
        ledger_.check_availability(request->department_id(), request->amount());
    if (!availability) {
      response->set_code(procura::v1::RESULT_CODE_NOT_FOUND);
      response->set_log("no budget for department");
      return finish_ok(context);
    }
    response->set_code(procura::v1::RESULT_CODE_OK);
    response->set_available(availability->available);
    response->set_requested(availability->requested);
    response->set_remaining(availability->remaining);
  } catch (const procura::common::invariant_violation& violation) {
    return finish_internal(context, violation);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetBudgetSummary(
    grpc::CallbackServerContext* context,
    const procura::v1::GetBudgetSummaryRequest* request,
    procura::v1::GetBudgetSummaryResponse* response) {
  try {
    auto summary = ledger_.summary(request->department_id());
    if (!summary) {
      response->set_code(procura::v1::RESULT_CODE_NOT_FOUND);
      response->set_log("no budget for department");
      return finish_ok(context);
    }
    response->set_code(procura::v1::RESULT_CODE_OK);
    response->set_department_id(summary->department_id);
    response->set_name(summary->name);
    response->set_fiscal_year(summary->fiscal_year);
    response->set_allocated(summary->allocated);
    response->set_spent(summary->spent);
    response->set_reserved(summary->reserved);
    response->set_available(summary->available);
    response->set_utilization_percent(summary->utilization_percent);
  } catch (const procura::common::invariant_violation& violation) {
    return finish_internal(context, violation);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListApprovedSuppliers(
    grpc::CallbackServerContext* context,
    const procura::v1::ListApprovedSuppliersRequest* request,
    procura::v1::ListApprovedSuppliersResponse* response) {
  auto category = request->category().empty()
                      ? std::nullopt
                      : std::optional<std::string>{request->category()};
  for (const auto& supplier : suppliers_.list_approved_suppliers(category)) {
    auto* out = response->add_suppliers();
    out->set_supplier_id(supplier.supplier_id);
    out->set_name(supplier.name);
    out->set_status(std::string{to_string(supplier.status)});
    out->set_rating_hundredths(supplier.rating_hundredths);
    out->set_risk_score(std::string{to_string(supplier.risk_score)});
    out->set_max_order_value(supplier.max_order_value);
    out->set_payment_terms(supplier.payment_terms);
    out->set_contact_email(supplier.contact_email);
    for (const auto& entry : supplier.categories) {
      out->add_categories(entry);
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetApprovalMatrix(
    grpc::CallbackServerContext* context,
    const procura::v1::GetApprovalMatrixRequest* /*request*/,
    procura::v1::GetApprovalMatrixResponse* response) {
  for (const auto& rule : policy_.list_rules()) {
    auto* out = response->add_rules();
    out->set_rule_id(rule.rule_id);
    out->set_max_amount(rule.max_amount);
    for (const auto& role : rule.required_approvers) {
      out->add_required_approvers(role);
    }
    out->set_auto_approve(rule.auto_approve);
    out->set_active(rule.active);
    out->set_expires_at(rule.expires_at.value_or(0));
    out->set_description(rule.description);
  }
  return finish_ok(context);
}

}  // namespace procura::rpc
