#pragma once
#include <procura/schema/primitives.hpp>
#include <procura/schema/routing_outcome.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: routing decision.
// Procurement workflow: the router's verdict for one purchase order,
// persisted with the order so approver actions are checked against it.
namespace procura::schema {

template <uint16_t Version>
struct routing_decision;

template <>
struct routing_decision<1> final {
  uint16_t version{1};
  routing_outcome_t outcome{routing_outcome_t::requires_approval};
  std::vector<approver_role_t> required_roles;
  bool escalated{false};
  std::optional<rule_id_t> rule_id;
  std::string reason;
};

using routing_decision_t = routing_decision<1>;

}  // namespace procura::schema
