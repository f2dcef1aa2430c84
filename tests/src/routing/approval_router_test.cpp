#include <gtest/gtest.h>
#include <procura/testing/engine_fixture.hpp>

#include <string>
#include <vector>

namespace {

using procura::schema::result_code_t;
using procura::schema::risk_score_t;
using procura::schema::routing_outcome_t;
using procura::schema::supplier_status_t;
using procura::testing::engine_fixture;
using procura::testing::make_approver;
using procura::testing::make_rule;
using procura::testing::make_supplier;

using roles_t = std::vector<procura::schema::approver_role_t>;

}  // namespace

TEST(approval_router, auto_approves_low_risk_approved_supplier) {
  auto fixture = engine_fixture{"procura_router_auto"};
  fixture.load_default_policy();
  fixture.suppliers().upsert_supplier(make_supplier(
      "SUP-1", supplier_status_t::approved, risk_score_t::low, 10000000));

  auto routed = fixture.router().route("SUP-1", 50000,
                                       procura::schema::now_milliseconds());
  ASSERT_EQ(routed.code, result_code_t::ok);
  ASSERT_TRUE(routed.decision.has_value());
  EXPECT_EQ(routed.decision->outcome, routing_outcome_t::auto_approved);
  EXPECT_TRUE(routed.decision->required_roles.empty());
  EXPECT_EQ(routed.decision->rule_id, 1u);
}

TEST(approval_router, high_risk_overrides_auto_approve) {
  auto fixture = engine_fixture{"procura_router_high_risk"};
  fixture.policy().upsert_approver(make_approver("finance_manager"));
  fixture.policy().upsert_rule(make_rule(1, 1000, {"finance_manager"}, true));
  fixture.suppliers().upsert_supplier(make_supplier(
      "SUP-RISK", supplier_status_t::approved, risk_score_t::high, 100000));

  auto routed = fixture.router().route("SUP-RISK", 500,
                                       procura::schema::now_milliseconds());
  ASSERT_TRUE(routed.decision.has_value());
  EXPECT_EQ(routed.decision->outcome, routing_outcome_t::requires_approval);
  EXPECT_EQ(routed.decision->required_roles, roles_t{"finance_manager"});
  EXPECT_FALSE(routed.decision->escalated);
}

TEST(approval_router, pending_supplier_is_routed_manually) {
  auto fixture = engine_fixture{"procura_router_pending"};
  fixture.load_default_policy();
  fixture.suppliers().upsert_supplier(make_supplier(
      "SUP-NEW", supplier_status_t::pending, risk_score_t::low, 10000000));

  auto routed = fixture.router().route("SUP-NEW", 50000,
                                       procura::schema::now_milliseconds());
  ASSERT_TRUE(routed.decision.has_value());
  EXPECT_EQ(routed.decision->outcome, routing_outcome_t::requires_approval);
}

TEST(approval_router, capacity_and_suspension_block_regardless_of_rules) {
  auto fixture = engine_fixture{"procura_router_blocked"};
  fixture.load_default_policy();
  fixture.suppliers().upsert_supplier(make_supplier(
      "SUP-SMALL", supplier_status_t::approved, risk_score_t::low, 40000));
  fixture.suppliers().upsert_supplier(make_supplier(
      "SUP-OFF", supplier_status_t::suspended, risk_score_t::low, 10000000));
  auto now = procura::schema::now_milliseconds();

  auto over = fixture.router().route("SUP-SMALL", 50000, now);
  ASSERT_TRUE(over.decision.has_value());
  EXPECT_EQ(over.decision->outcome, routing_outcome_t::blocked);

  auto exact = fixture.router().route("SUP-SMALL", 40000, now);
  EXPECT_EQ(exact.decision->outcome, routing_outcome_t::auto_approved);

  auto suspended = fixture.router().route("SUP-OFF", 100, now);
  EXPECT_EQ(suspended.decision->outcome, routing_outcome_t::blocked);
}

TEST(approval_router, unknown_supplier_is_not_found) {
  auto fixture = engine_fixture{"procura_router_missing"};
  fixture.load_default_policy();
  auto routed = fixture.router().route("SUP-404", 100,
                                       procura::schema::now_milliseconds());
  EXPECT_EQ(routed.code, result_code_t::not_found);
  EXPECT_FALSE(routed.decision.has_value());
}

TEST(approval_router, deduplicates_and_drops_inactive_approvers) {
  auto fixture = engine_fixture{"procura_router_dedup"};
  fixture.policy().upsert_approver(make_approver("finance_manager"));
  fixture.policy().upsert_approver(make_approver("director"));
  fixture.policy().upsert_approver(make_approver("cfo", false));
  fixture.policy().upsert_rule(make_rule(
      1, 1000000, {"director", "cfo", "finance_manager", "director"}));
  fixture.suppliers().upsert_supplier(make_supplier(
      "SUP-1", supplier_status_t::approved, risk_score_t::low, 10000000));

  auto routed = fixture.router().route("SUP-1", 500000,
                                       procura::schema::now_milliseconds());
  ASSERT_TRUE(routed.decision.has_value());
  EXPECT_EQ(routed.decision->required_roles,
            (roles_t{"director", "finance_manager"}));
  EXPECT_FALSE(routed.decision->escalated);
}

TEST(approval_router, empty_approver_list_escalates_to_fallback) {
  auto fixture = engine_fixture{"procura_router_fallback", 0, "vp_finance"};
  fixture.policy().upsert_approver(make_approver("cfo", false));
  fixture.policy().upsert_rule(make_rule(1, 1000000, {"cfo", "unknown_role"}));
  fixture.suppliers().upsert_supplier(make_supplier(
      "SUP-1", supplier_status_t::approved, risk_score_t::low, 10000000));

  auto routed = fixture.router().route("SUP-1", 500000,
                                       procura::schema::now_milliseconds());
  ASSERT_TRUE(routed.decision.has_value());
  EXPECT_EQ(routed.decision->outcome, routing_outcome_t::requires_approval);
  EXPECT_EQ(routed.decision->required_roles, roles_t{"vp_finance"});
  EXPECT_TRUE(routed.decision->escalated);
}

TEST(approval_router, amount_above_matrix_adds_fallback_to_top_bracket) {
  auto fixture = engine_fixture{"procura_router_manual"};
  fixture.load_default_policy();
  fixture.policy().upsert_approver(make_approver("director", false));
  fixture.suppliers().upsert_supplier(make_supplier(
      "SUP-1", supplier_status_t::approved, risk_score_t::low, 100000000));

  auto routed = fixture.router().route("SUP-1", 20000000,
                                       procura::schema::now_milliseconds());
  ASSERT_TRUE(routed.decision.has_value());
  EXPECT_EQ(routed.decision->outcome, routing_outcome_t::requires_approval);
  EXPECT_TRUE(routed.decision->escalated);
  EXPECT_EQ(routed.decision->rule_id, 3u);
  EXPECT_EQ(routed.decision->required_roles,
            (roles_t{"finance_manager", "director"}));
}

TEST(approval_router, repeated_routing_is_deterministic) {
  auto fixture = engine_fixture{"procura_router_deterministic"};
  fixture.load_default_policy();
  fixture.suppliers().upsert_supplier(make_supplier(
      "SUP-1", supplier_status_t::approved, risk_score_t::medium, 100000000));
  auto now = procura::schema::now_milliseconds();

  auto first = fixture.router().route("SUP-1", 750000, now);
  for (auto i = 0; i < 10; ++i) {
    auto again = fixture.router().route("SUP-1", 750000, now);
    ASSERT_TRUE(again.decision.has_value());
    EXPECT_EQ(again.decision->outcome, first.decision->outcome);
    EXPECT_EQ(again.decision->required_roles, first.decision->required_roles);
    EXPECT_EQ(again.decision->rule_id, first.decision->rule_id);
    EXPECT_EQ(again.decision->escalated, first.decision->escalated);
    EXPECT_EQ(again.decision->reason, first.decision->reason);
  }
}
