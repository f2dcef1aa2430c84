#include <gtest/gtest.h>
#include <procura/rpc/server.hpp>
#include <procura/testing/engine_fixture.hpp>

#include <string>

namespace {

using procura::schema::risk_score_t;
using procura::schema::supplier_status_t;
using procura::testing::engine_fixture;
using procura::testing::make_budget;
using procura::testing::make_supplier;

void seed(engine_fixture& fixture) {
  fixture.load_default_policy();
  fixture.suppliers().upsert_supplier(make_supplier(
      "SUP-1", supplier_status_t::approved, risk_score_t::low, 100000000));
  fixture.ledger().upsert_budget(make_budget("ENG", 5000000, 1000000));
}

procura::rpc::listener make_listener(engine_fixture& fixture) {
  return procura::rpc::listener{fixture.orchestrator(), fixture.router(),
                                fixture.ledger(), fixture.suppliers(),
                                fixture.policy()};
}

}  // namespace

TEST(rpc_server, submit_and_approve_round_trip_through_listener) {
  auto fixture = engine_fixture{"procura_rpc_submit"};
  seed(fixture);
  auto listener = make_listener(fixture);

  auto submit = procura::v1::SubmitPurchaseOrderRequest{};
  submit.set_po_id("PO-RPC-1");
  submit.set_department_id("ENG");
  submit.set_supplier_id("SUP-1");
  submit.set_amount(2000000);
  submit.set_requested_by("alice");
  auto* item = submit.add_items();
  item->set_description("servers");
  item->set_quantity(2);
  item->set_unit_price(1000000);

  auto context = grpc::CallbackServerContext{};
  auto submitted = procura::v1::OrderResponse{};
  listener.SubmitPurchaseOrder(&context, &submit, &submitted);
  EXPECT_EQ(submitted.code(), procura::v1::RESULT_CODE_OK);
  EXPECT_EQ(submitted.order().status(), "awaiting_approval");
  EXPECT_EQ(submitted.order().routing().required_roles_size(), 2);
  EXPECT_EQ(submitted.order().reservation_id(), "RSV-PO-RPC-1");

  for (const auto* role : {"finance_manager", "director"}) {
    auto action = procura::v1::RecordApproverActionRequest{};
    action.set_po_id("PO-RPC-1");
    action.set_role(role);
    action.set_decision(procura::v1::DECISION_APPROVE);
    auto action_context = grpc::CallbackServerContext{};
    auto response = procura::v1::OrderResponse{};
    listener.RecordApproverAction(&action_context, &action, &response);
    EXPECT_EQ(response.code(), procura::v1::RESULT_CODE_OK);
  }

  auto get = procura::v1::GetPurchaseOrderRequest{};
  get.set_po_id("PO-RPC-1");
  auto get_context = grpc::CallbackServerContext{};
  auto fetched = procura::v1::OrderResponse{};
  listener.GetPurchaseOrder(&get_context, &get, &fetched);
  EXPECT_EQ(fetched.code(), procura::v1::RESULT_CODE_OK);
  EXPECT_EQ(fetched.order().status(), "consumed");
  EXPECT_EQ(fetched.order().actions_size(), 2);
}

TEST(rpc_server, unspecified_decision_is_an_invalid_request) {
  auto fixture = engine_fixture{"procura_rpc_decision"};
  seed(fixture);
  auto listener = make_listener(fixture);

  auto action = procura::v1::RecordApproverActionRequest{};
  action.set_po_id("PO-X");
  action.set_role("director");
  auto context = grpc::CallbackServerContext{};
  auto response = procura::v1::OrderResponse{};
  listener.RecordApproverAction(&context, &action, &response);
  EXPECT_EQ(response.code(), procura::v1::RESULT_CODE_INVALID_REQUEST);
}

TEST(rpc_server, budget_reads_report_ledger_state) {
  auto fixture = engine_fixture{"procura_rpc_budget"};
  seed(fixture);
  auto listener = make_listener(fixture);

  auto check = procura::v1::CheckBudgetAvailabilityRequest{};
  check.set_department_id("ENG");
  check.set_amount(4500000);
  auto check_context = grpc::CallbackServerContext{};
  auto availability = procura::v1::CheckBudgetAvailabilityResponse{};
  listener.CheckBudgetAvailability(&check_context, &check, &availability);
  EXPECT_EQ(availability.code(), procura::v1::RESULT_CODE_OK);
  EXPECT_FALSE(availability.available());
  EXPECT_EQ(availability.remaining(), 4000000u);

  auto summary_request = procura::v1::GetBudgetSummaryRequest{};
  summary_request.set_department_id("ENG");
  auto summary_context = grpc::CallbackServerContext{};
  auto summary = procura::v1::GetBudgetSummaryResponse{};
  listener.GetBudgetSummary(&summary_context, &summary_request, &summary);
  EXPECT_EQ(summary.code(), procura::v1::RESULT_CODE_OK);
  EXPECT_DOUBLE_EQ(summary.utilization_percent(), 20.0);

  summary_request.set_department_id("NOPE");
  auto missing_context = grpc::CallbackServerContext{};
  auto missing = procura::v1::GetBudgetSummaryResponse{};
  listener.GetBudgetSummary(&missing_context, &summary_request, &missing);
  EXPECT_EQ(missing.code(), procura::v1::RESULT_CODE_NOT_FOUND);
}

TEST(rpc_server, reference_data_reads) {
  auto fixture = engine_fixture{"procura_rpc_reference"};
  seed(fixture);
  auto listener = make_listener(fixture);

  auto matrix_request = procura::v1::GetApprovalMatrixRequest{};
  auto matrix_context = grpc::CallbackServerContext{};
  auto matrix = procura::v1::GetApprovalMatrixResponse{};
  listener.GetApprovalMatrix(&matrix_context, &matrix_request, &matrix);
  ASSERT_EQ(matrix.rules_size(), 3);
  EXPECT_EQ(matrix.rules(0).max_amount(), 100000u);
  EXPECT_TRUE(matrix.rules(0).auto_approve());

  auto suppliers_request = procura::v1::ListApprovedSuppliersRequest{};
  suppliers_request.set_category("office");
  auto suppliers_context = grpc::CallbackServerContext{};
  auto suppliers = procura::v1::ListApprovedSuppliersResponse{};
  listener.ListApprovedSuppliers(&suppliers_context, &suppliers_request,
                                 &suppliers);
  ASSERT_EQ(suppliers.suppliers_size(), 1);
  EXPECT_EQ(suppliers.suppliers(0).risk_score(), "low");

  auto route_request = procura::v1::RoutePurchaseOrderRequest{};
  route_request.set_supplier_id("SUP-1");
  route_request.set_amount(50000);
  auto route_context = grpc::CallbackServerContext{};
  auto route = procura::v1::RoutePurchaseOrderResponse{};
  listener.RoutePurchaseOrder(&route_context, &route_request, &route);
  EXPECT_EQ(route.code(), procura::v1::RESULT_CODE_OK);
  EXPECT_EQ(route.decision().outcome(), "auto_approved");
}
