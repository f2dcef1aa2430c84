#include <gtest/gtest.h>
#include <procura/schema/encoding/scale/encoder.hpp>
#include <procura/schema/key/engine_keys.hpp>
#include <procura/schema/purchase_order_state.hpp>
#include <procura/schema/result_code.hpp>
#include <procura/schema/supplier_state.hpp>

#include <algorithm>
#include <string>

namespace {

using encoder_t = procura::schema::encoding::encoder<
    procura::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(encoding_types, enum_strings_round_trip) {
  EXPECT_EQ(procura::schema::to_string(
                procura::schema::po_status_t::awaiting_approval),
            "awaiting_approval");
  EXPECT_EQ(procura::schema::try_from_string<procura::schema::po_status_t>(
                "pending_budget"),
            procura::schema::po_status_t::pending_budget);
  EXPECT_FALSE(
      procura::schema::try_from_string<procura::schema::risk_score_t>("extreme")
          .has_value());
  EXPECT_EQ(procura::schema::to_string(
                procura::schema::result_code_t::insufficient_budget),
            "insufficient_budget");
}

TEST(encoding_types, purchase_order_survives_encoding) {
  auto encoder = encoder_t{};
  auto order = procura::schema::purchase_order_state_t{};
  order.po_id = "PO-7";
  order.department_id = "ENG";
  order.supplier_id = "SUP-1";
  order.amount = 250000;
  order.requested_by = "alice";
  order.items = {procura::schema::line_item_t{
      .description = "laptops", .quantity = 2, .unit_price = 125000}};
  order.status = procura::schema::po_status_t::awaiting_approval;
  order.routing = procura::schema::routing_decision_t{
      .outcome = procura::schema::routing_outcome_t::requires_approval,
      .required_roles = {"finance_manager", "director"},
      .escalated = false,
      .rule_id = 3u,
      .reason = "requires approval under rule 3"};
  order.reservation_id = "RSV-PO-7";
  order.actions = {procura::schema::approver_action_t{
      .role = "finance_manager",
      .decision = procura::schema::approval_decision_t::approve,
      .recorded_at = 42}};

  auto encoded = encoder.encode(order);
  auto decoded =
      encoder.decode<procura::schema::purchase_order_state_t>(encoded);
  EXPECT_EQ(decoded.po_id, order.po_id);
  EXPECT_EQ(decoded.amount, order.amount);
  EXPECT_EQ(decoded.status, order.status);
  ASSERT_TRUE(decoded.routing.has_value());
  EXPECT_EQ(decoded.routing->required_roles, order.routing->required_roles);
  EXPECT_EQ(decoded.routing->rule_id, order.routing->rule_id);
  ASSERT_EQ(decoded.actions.size(), 1u);
  EXPECT_EQ(decoded.actions[0].decision,
            procura::schema::approval_decision_t::approve);
  EXPECT_EQ(decoded.items[0].unit_price, 125000u);
}

TEST(encoding_types, try_decode_rejects_truncated_bytes) {
  auto encoder = encoder_t{};
  auto supplier = procura::schema::supplier_state_t{};
  supplier.supplier_id = "SUP-1";
  supplier.categories = {"office", "it"};
  auto encoded = encoder.encode(supplier);
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(
      encoder.try_decode<procura::schema::supplier_state_t>(encoded)
          .has_value());
}

TEST(encoding_types, rule_keys_sort_by_amount_then_id) {
  auto encoder = encoder_t{};
  auto small = procura::schema::key::make_rule_key(encoder, 900, 7);
  auto large = procura::schema::key::make_rule_key(encoder, 100000, 1);
  auto large_later = procura::schema::key::make_rule_key(encoder, 100000, 2);
  EXPECT_TRUE(std::lexicographical_compare(small.begin(), small.end(),
                                           large.begin(), large.end()));
  EXPECT_TRUE(std::lexicographical_compare(large.begin(), large.end(),
                                           large_later.begin(),
                                           large_later.end()));

  auto seek = procura::schema::key::make_rule_seek_key(encoder, 100000);
  EXPECT_TRUE(std::lexicographical_compare(small.begin(), small.end(),
                                           seek.begin(), seek.end()));
  EXPECT_FALSE(std::lexicographical_compare(large.begin(), large.end(),
                                            seek.begin(), seek.end()));
}
