#pragma once

#include <procura/v1/procurement.grpc.pb.h>
#include <procura/budget/budget_ledger.hpp>
#include <procura/orchestration/orchestrator.hpp>
#include <procura/policy/policy_store.hpp>
#include <procura/routing/approval_router.hpp>
#include <procura/supplier/supplier_registry.hpp>

namespace procura::rpc {

/// Callback listener for the procura.v1.Procurement service.
///
/// Quick reference:
/// - SubmitPurchaseOrder/RecordApproverAction/CancelPurchaseOrder/
///   RetryReservation: lifecycle operations, answered with OrderResponse.
/// - GetPurchaseOrder/RoutePurchaseOrder: reads; routing is a dry run.
/// - CheckBudgetAvailability/GetBudgetSummary: ledger reads.
/// - ListApprovedSuppliers/GetApprovalMatrix: reference data.
/// Engine outcomes are carried in the response code. Ledger invariant
/// violations finish the call with INTERNAL.
struct listener final : public procura::v1::Procurement::CallbackService {
  listener(procura::orchestration::orchestrator& orchestrator,
           const procura::routing::approval_router& router,
           const procura::budget::budget_ledger& ledger,
           const procura::supplier::supplier_registry& suppliers,
           const procura::policy::policy_store& policy);

  virtual grpc::ServerUnaryReactor* SubmitPurchaseOrder(
      grpc::CallbackServerContext* context,
      const procura::v1::SubmitPurchaseOrderRequest* request,
      procura::v1::OrderResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RecordApproverAction(
      grpc::CallbackServerContext* context,
      const procura::v1::RecordApproverActionRequest* request,
      procura::v1::OrderResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CancelPurchaseOrder(
      grpc::CallbackServerContext* context,
      const procura::v1::CancelPurchaseOrderRequest* request,
      procura::v1::OrderResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RetryReservation(
      grpc::CallbackServerContext* context,
      const procura::v1::RetryReservationRequest* request,
      procura::v1::OrderResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetPurchaseOrder(
      grpc::CallbackServerContext* context,
      const procura::v1::GetPurchaseOrderRequest* request,
      procura::v1::OrderResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RoutePurchaseOrder(
      grpc::CallbackServerContext* context,
      const procura::v1::RoutePurchaseOrderRequest* request,
      procura::v1::RoutePurchaseOrderResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CheckBudgetAvailability(
      grpc::CallbackServerContext* context,
      const procura::v1::CheckBudgetAvailabilityRequest* request,
      procura::v1::CheckBudgetAvailabilityResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetBudgetSummary(
      grpc::CallbackServerContext* context,
      const procura::v1::GetBudgetSummaryRequest* request,
      procura::v1::GetBudgetSummaryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListApprovedSuppliers(
      grpc::CallbackServerContext* context,
      const procura::v1::ListApprovedSuppliersRequest* request,
      procura::v1::ListApprovedSuppliersResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetApprovalMatrix(
      grpc::CallbackServerContext* context,
      const procura::v1::GetApprovalMatrixRequest* request,
      procura::v1::GetApprovalMatrixResponse* response) override final;

 private:
  procura::orchestration::orchestrator& orchestrator_;
  const procura::routing::approval_router& router_;
  const procura::budget::budget_ledger& ledger_;
  const procura::supplier::supplier_registry& suppliers_;
  const procura::policy::policy_store& policy_;
};

}  // namespace procura::rpc
