#pragma once
#include <procura/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: approval rule.
// Procurement workflow: one amount bracket of the approval matrix. A rule
// covers every amount up to and including max_amount.
namespace procura::schema {

template <uint16_t Version>
struct approval_rule;

template <>
struct approval_rule<1> final {
  uint16_t version{1};
  rule_id_t rule_id{};
  amount_t max_amount{};
  std::vector<approver_role_t> required_approvers;  // in routing order
  bool auto_approve{false};
  bool active{true};
  std::optional<timestamp_milliseconds_t> expires_at;
  std::string description;
};

using approval_rule_t = approval_rule<1>;

}  // namespace procura::schema
