#pragma once
#include <procura/schema/primitives.hpp>
#include <string>

// Schema type: budget state.
// Procurement workflow: departmental budget for one fiscal year. Invariant:
// spent + reserved <= allocated.
namespace procura::schema {

template <uint16_t Version>
struct budget_state;

template <>
struct budget_state<1> final {
  uint16_t version{1};
  department_id_t department_id;
  std::string name;
  amount_t allocated{};
  amount_t spent{};
  amount_t reserved{};
  uint16_t fiscal_year{};
  std::string manager_email;
};

using budget_state_t = budget_state<1>;

}  // namespace procura::schema
