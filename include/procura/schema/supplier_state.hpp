#pragma once
#include <procura/schema/primitives.hpp>
#include <procura/schema/risk_score.hpp>
#include <procura/schema/supplier_status.hpp>
#include <string>
#include <vector>

// Schema type: supplier state.
// Procurement workflow: vendor master row consumed by routing for status,
// risk and per-order capacity.
namespace procura::schema {

template <uint16_t Version>
struct supplier_state;

template <>
struct supplier_state<1> final {
  uint16_t version{1};
  supplier_id_t supplier_id;
  std::string name;
  supplier_status_t status{supplier_status_t::pending};
  uint16_t rating_hundredths{};  // 0..500 for a 0.00..5.00 rating
  risk_score_t risk_score{risk_score_t::medium};
  amount_t max_order_value{};
  std::string payment_terms;
  std::string contact_email;
  std::vector<std::string> categories;
};

using supplier_state_t = supplier_state<1>;

}  // namespace procura::schema
