#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <procura/routing/approval_router.hpp>

using namespace procura::schema;

namespace {

routing_decision_t make_blocked(std::string reason) {
  auto decision = routing_decision_t{};
  decision.outcome = routing_outcome_t::blocked;
  decision.reason = std::move(reason);
  return decision;
}

bool contains(const std::vector<approver_role_t>& roles,
              const approver_role_t& role) {
  return std::find(std::begin(roles), std::end(roles), role) !=
         std::end(roles);
}

}  // namespace

namespace procura::routing {

approval_router::approval_router(
    const procura::policy::policy_store& policy,
    const procura::supplier::supplier_registry& suppliers,
    approver_role_t fallback_role)
    : policy_{policy},
      suppliers_{suppliers},
      fallback_role_{std::move(fallback_role)} {}

route_result approval_router::route(const supplier_id_t& supplier_id,
                                    const amount_t amount,
                                    const timestamp_milliseconds_t now) const {
  auto supplier = suppliers_.find_supplier(supplier_id);
  if (!supplier) {
    return route_result{
        .code = result_code_t::not_found,
        .log = fmt::format("supplier '{}' not found", supplier_id)};
  }

  if (supplier->status == supplier_status_t::suspended) {
    spdlog::warn("Supplier '{}' is suspended; order blocked", supplier_id);
    return route_result{
        .decision = make_blocked(
            fmt::format("supplier '{}' is suspended", supplier_id))};
  }
  if (amount > supplier->max_order_value) {
    spdlog::warn("Order of {} exceeds capacity {} of supplier '{}'",
                 format_amount(amount),
                 format_amount(supplier->max_order_value), supplier_id);
    return route_result{
        .decision = make_blocked(fmt::format(
            "amount {} exceeds supplier max order value {}",
            format_amount(amount), format_amount(supplier->max_order_value)))};
  }

  auto match = policy_.find_rule(amount, now);
  auto decision = routing_decision_t{};
  decision.outcome = routing_outcome_t::requires_approval;
  if (match.rule) {
    decision.rule_id = match.rule->rule_id;
  }

  if (match.manual_escalation) {
    if (match.rule) {
      decision.required_roles = active_roles(match.rule->required_approvers);
    }
    if (!contains(decision.required_roles, fallback_role_)) {
      decision.required_roles.push_back(fallback_role_);
    }
    decision.escalated = true;
    decision.reason = fmt::format(
        "amount {} exceeds every approval bracket; manual escalation",
        format_amount(amount));
    return route_result{.decision = std::move(decision)};
  }

  const auto& rule = *match.rule;
  if (rule.auto_approve && supplier->risk_score != risk_score_t::high &&
      supplier->status == supplier_status_t::approved) {
    decision.outcome = routing_outcome_t::auto_approved;
    decision.reason = fmt::format("auto-approved under rule {}", rule.rule_id);
    return route_result{.decision = std::move(decision)};
  }

  decision.required_roles = active_roles(rule.required_approvers);
  if (decision.required_roles.empty()) {
    spdlog::warn("No active approver for rule {}; escalating to '{}'",
                 rule.rule_id, fallback_role_);
    decision.required_roles.push_back(fallback_role_);
    decision.escalated = true;
    decision.reason = fmt::format(
        "no active approver under rule {}; escalated to {}", rule.rule_id,
        fallback_role_);
  } else if (rule.auto_approve) {
    decision.reason = fmt::format(
        "rule {} auto-approves but supplier '{}' is {} risk and {}",
        rule.rule_id, supplier_id, to_string(supplier->risk_score),
        to_string(supplier->status));
  } else {
    decision.reason = fmt::format("requires approval under rule {}",
                                  rule.rule_id);
  }
  return route_result{.decision = std::move(decision)};
}

bool approval_router::escalate_inactive(routing_decision_t& decision) const {
  auto roles = std::vector<approver_role_t>{};
  auto replaced = false;
  for (const auto& role : decision.required_roles) {
    auto approver = policy_.find_approver(role);
    if (role == fallback_role_ || (approver && approver->active)) {
      if (!contains(roles, role)) {
        roles.push_back(role);
      }
      continue;
    }
    spdlog::warn("Approver '{}' is inactive; escalating to '{}'", role,
                 fallback_role_);
    replaced = true;
    if (!contains(roles, fallback_role_)) {
      roles.push_back(fallback_role_);
    }
  }
  if (!replaced) {
    return false;
  }
  decision.required_roles = std::move(roles);
  decision.escalated = true;
  decision.reason = fmt::format(
      "required approver inactive; escalated to {}", fallback_role_);
  return true;
}

std::vector<approver_role_t> approval_router::active_roles(
    const std::vector<approver_role_t>& roles) const {
  auto result = std::vector<approver_role_t>{};
  for (const auto& role : roles) {
    if (contains(result, role)) {
      continue;
    }
    auto approver = policy_.find_approver(role);
    if (approver && approver->active) {
      result.push_back(role);
    }
  }
  return result;
}

}  // namespace procura::routing
