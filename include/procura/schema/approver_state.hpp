#pragma once
#include <procura/schema/primitives.hpp>
#include <string>

// Schema type: approver state.
// Procurement workflow: the person currently holding an approver role.
namespace procura::schema {

template <uint16_t Version>
struct approver_state;

template <>
struct approver_state<1> final {
  uint16_t version{1};
  approver_role_t role;
  std::string name;
  std::string email;
  std::string department;
  bool active{true};
};

using approver_state_t = approver_state<1>;

}  // namespace procura::schema
