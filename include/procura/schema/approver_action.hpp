#pragma once
#include <procura/schema/approval_decision.hpp>
#include <procura/schema/primitives.hpp>

namespace procura::schema {

template <uint16_t Version>
struct approver_action;

template <>
struct approver_action<1> final {
  uint16_t version{1};
  approver_role_t role;
  approval_decision_t decision{approval_decision_t::approve};
  timestamp_milliseconds_t recorded_at{};
};

using approver_action_t = approver_action<1>;

}  // namespace procura::schema
