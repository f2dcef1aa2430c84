#pragma once

#include <procura/budget/reservation_manager.hpp>
#include <procura/common/keyed_mutex.hpp>
#include <procura/policy/policy_store.hpp>
#include <procura/routing/approval_router.hpp>
#include <procura/schema/approval_decision.hpp>
#include <procura/schema/encoding/scale/encoder.hpp>
#include <procura/schema/primitives.hpp>
#include <procura/schema/purchase_order_request.hpp>
#include <procura/schema/purchase_order_state.hpp>
#include <procura/schema/result_code.hpp>
#include <procura/storage/rocksdb/storage.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace procura::orchestration {

/// Outcome of an orchestrator operation. `order` is the order's state after
/// the call whenever the order exists.
struct order_result final {
  procura::schema::result_code_t code{procura::schema::result_code_t::ok};
  std::string log;
  std::string codespace;
  std::optional<procura::schema::purchase_order_state_t> order;
};

/// Purchase order lifecycle driver.
///
/// Sequences routing, the budget hold and approver sign-off for each order.
/// Operations on one order are serialized by a per-order lock; budget
/// mutation is delegated to the reservation manager, which commits the
/// order record in the same batch as the ledger change. Locks are taken
/// order first, then department.
class orchestrator final {
 public:
  explicit orchestrator(
      procura::schema::encoding::encoder<
          procura::schema::encoding::scale_encoder_tag>& encoder,
      procura::storage::storage<procura::storage::rocksdb_storage_tag>&
          storage,
      const procura::policy::policy_store& policy,
      const procura::routing::approval_router& router,
      procura::budget::reservation_manager& reservations);

  /// Validate, route and reserve a new order. Auto-approved orders are
  /// consumed before this returns.
  order_result submit(const procura::schema::purchase_order_request_t& request);

  /// Apply one approver decision to an order awaiting approval. The first
  /// rejection is final; duplicate approvals are accepted without effect.
  order_result record_action(const procura::schema::po_id_t& po_id,
                             const procura::schema::approver_role_t& role,
                             procura::schema::approval_decision_t decision);

  /// Cancel an order awaiting approval or budget, releasing any hold.
  order_result cancel(const procura::schema::po_id_t& po_id,
                      std::string_view reason);

  /// Route and reserve again for an order parked in pending_budget.
  order_result retry_reservation(const procura::schema::po_id_t& po_id);

  std::optional<procura::schema::purchase_order_state_t> find(
      const procura::schema::po_id_t& po_id) const;

 private:
  /// Shared tail of submit and retry: the order is in draft or
  /// pending_budget and its lock is held.
  order_result route_and_reserve(procura::schema::purchase_order_state_t order,
                                 std::string_view codespace);

  /// Approve path tail: approved -> consumed against the order's hold.
  order_result finish_approved(procura::schema::purchase_order_state_t order,
                               std::string_view codespace);

  procura::schema::po_id_t next_po_id();

  void save(const procura::schema::purchase_order_state_t& order);

  procura::storage::write_set stage(
      const procura::schema::purchase_order_state_t& order);

  procura::schema::encoding::encoder<
      procura::schema::encoding::scale_encoder_tag>& encoder_;
  procura::storage::storage<procura::storage::rocksdb_storage_tag>& storage_;
  const procura::policy::policy_store& policy_;
  const procura::routing::approval_router& router_;
  procura::budget::reservation_manager& reservations_;
  procura::common::keyed_mutex<procura::schema::po_id_t> orders_;
  std::atomic<uint64_t> sequence_{};
};

/// Move `order` along a lifecycle edge and record it in the history.
/// Throws common::invariant_violation for edges missing from the table.
void advance(procura::schema::purchase_order_state_t& order,
             procura::schema::po_status_t to,
             procura::schema::timestamp_milliseconds_t at);

/// Field-level checks applied before an order is accepted. Returns the
/// first problem found.
std::optional<std::string> validate_request(
    const procura::schema::purchase_order_request_t& request);

}  // namespace procura::orchestration
