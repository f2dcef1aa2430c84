#include <gtest/gtest.h>
#include <procura/orchestration/transitions.hpp>

using procura::orchestration::is_allowed;
using procura::orchestration::is_cancellable;
using procura::orchestration::is_terminal;
using procura::schema::po_status_t;

TEST(transitions, terminal_states_have_no_outgoing_edges) {
  for (auto from : {po_status_t::blocked, po_status_t::consumed,
                    po_status_t::released}) {
    EXPECT_TRUE(is_terminal(from));
    for (const auto& [edge_from, edge_to] :
         procura::orchestration::kTransitions) {
      EXPECT_NE(edge_from, from);
    }
  }
}

TEST(transitions, approval_outcomes_are_final) {
  EXPECT_TRUE(is_allowed(po_status_t::awaiting_approval, po_status_t::approved));
  EXPECT_TRUE(is_allowed(po_status_t::awaiting_approval, po_status_t::rejected));
  EXPECT_FALSE(is_allowed(po_status_t::rejected, po_status_t::approved));
  EXPECT_FALSE(is_allowed(po_status_t::approved, po_status_t::rejected));
  EXPECT_FALSE(is_allowed(po_status_t::approved, po_status_t::released));
}

TEST(transitions, pending_budget_can_retry_or_cancel) {
  EXPECT_TRUE(is_allowed(po_status_t::pending_budget, po_status_t::routed));
  EXPECT_TRUE(is_allowed(po_status_t::pending_budget, po_status_t::released));
  EXPECT_FALSE(is_allowed(po_status_t::pending_budget, po_status_t::reserved));
  EXPECT_TRUE(is_cancellable(po_status_t::pending_budget));
  EXPECT_TRUE(is_cancellable(po_status_t::awaiting_approval));
  EXPECT_FALSE(is_cancellable(po_status_t::reserved));
  EXPECT_FALSE(is_cancellable(po_status_t::draft));
}
