#pragma once

#include <procura/policy/policy_store.hpp>
#include <procura/schema/primitives.hpp>
#include <procura/schema/result_code.hpp>
#include <procura/schema/routing_decision.hpp>
#include <procura/supplier/supplier_registry.hpp>
#include <optional>
#include <string>
#include <vector>

namespace procura::routing {

struct route_result final {
  procura::schema::result_code_t code{procura::schema::result_code_t::ok};
  std::string log;
  std::optional<procura::schema::routing_decision_t> decision;
};

/// Decide how a purchase order is approved.
///
/// Every call reads current supplier and policy rows; nothing is cached, so
/// the decision is a function of the store at call time only.
class approval_router final {
 public:
  approval_router(const procura::policy::policy_store& policy,
                  const procura::supplier::supplier_registry& suppliers,
                  procura::schema::approver_role_t fallback_role);

  /// `not_found` when the supplier is unknown. Blocked orders are reported
  /// as an `ok` result carrying a blocked decision.
  route_result route(const procura::schema::supplier_id_t& supplier_id,
                     procura::schema::amount_t amount,
                     procura::schema::timestamp_milliseconds_t now) const;

  /// Replace required roles whose approver has since become inactive with
  /// the fallback role, marking the decision escalated. Returns false when
  /// every required role is still active.
  bool escalate_inactive(procura::schema::routing_decision_t& decision) const;

 private:
  /// Deduplicate preserving first occurrence, then drop inactive roles.
  std::vector<procura::schema::approver_role_t> active_roles(
      const std::vector<procura::schema::approver_role_t>& roles) const;

  const procura::policy::policy_store& policy_;
  const procura::supplier::supplier_registry& suppliers_;
  procura::schema::approver_role_t fallback_role_;
};

}  // namespace procura::routing
