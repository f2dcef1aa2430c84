#pragma once

#include <procura/schema/po_status.hpp>

#include <algorithm>
#include <array>
#include <utility>

// Purchase order lifecycle edges. Any edge absent from the table is an
// invalid transition.
namespace procura::orchestration {

using procura::schema::po_status_t;

inline constexpr auto kTransitions = std::array{
    std::pair{po_status_t::draft, po_status_t::routed},
    std::pair{po_status_t::routed, po_status_t::blocked},
    std::pair{po_status_t::routed, po_status_t::reserved},
    std::pair{po_status_t::routed, po_status_t::pending_budget},
    std::pair{po_status_t::pending_budget, po_status_t::routed},
    std::pair{po_status_t::pending_budget, po_status_t::released},
    std::pair{po_status_t::reserved, po_status_t::approved},
    std::pair{po_status_t::reserved, po_status_t::awaiting_approval},
    std::pair{po_status_t::awaiting_approval, po_status_t::approved},
    std::pair{po_status_t::awaiting_approval, po_status_t::rejected},
    std::pair{po_status_t::awaiting_approval, po_status_t::released},
    std::pair{po_status_t::approved, po_status_t::consumed},
    std::pair{po_status_t::rejected, po_status_t::released},
};

constexpr bool is_allowed(const po_status_t from, const po_status_t to) {
  return std::find(std::begin(kTransitions), std::end(kTransitions),
                   std::pair{from, to}) != std::end(kTransitions);
}

constexpr bool is_terminal(const po_status_t status) {
  return status == po_status_t::blocked || status == po_status_t::consumed ||
         status == po_status_t::released;
}

/// Only these states accept cancel().
constexpr bool is_cancellable(const po_status_t status) {
  return status == po_status_t::awaiting_approval ||
         status == po_status_t::pending_budget;
}

static_assert(is_allowed(po_status_t::draft, po_status_t::routed));
static_assert(!is_allowed(po_status_t::rejected, po_status_t::approved));
static_assert(!is_allowed(po_status_t::consumed, po_status_t::released));

}  // namespace procura::orchestration
