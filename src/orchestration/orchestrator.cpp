#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <ctime>
#include <procura/common/invariant_violation.hpp>
#include <procura/orchestration/orchestrator.hpp>
#include <procura/orchestration/transitions.hpp>
#include <procura/schema/key/engine_keys.hpp>

using namespace procura::schema;

namespace {

constexpr auto kSubmitCodespace = std::string_view{"procura.submit"};
constexpr auto kActionCodespace = std::string_view{"procura.action"};
constexpr auto kCancelCodespace = std::string_view{"procura.cancel"};
constexpr auto kRetryCodespace = std::string_view{"procura.retry"};

procura::orchestration::order_result make_result(
    const result_code_t code,
    std::string log,
    const std::string_view codespace,
    std::optional<purchase_order_state_t> order = std::nullopt) {
  return procura::orchestration::order_result{
      .code = code,
      .log = std::move(log),
      .codespace = std::string{codespace},
      .order = std::move(order)};
}

bool has_approved(const purchase_order_state_t& order,
                  const approver_role_t& role) {
  return std::any_of(std::begin(order.actions), std::end(order.actions),
                     [&](const approver_action_t& action) {
                       return action.role == role &&
                              action.decision == approval_decision_t::approve;
                     });
}

bool all_approved(const purchase_order_state_t& order) {
  const auto& roles = order.routing->required_roles;
  return std::all_of(std::begin(roles), std::end(roles),
                     [&](const approver_role_t& role) {
                       return has_approved(order, role);
                     });
}

}  // namespace

namespace procura::orchestration {

void advance(purchase_order_state_t& order,
             const po_status_t to,
             const timestamp_milliseconds_t at) {
  if (!is_allowed(order.status, to)) {
    throw procura::common::invariant_violation{
        fmt::format("order '{}' cannot move from {} to {}", order.po_id,
                    to_string(order.status), to_string(to))};
  }
  order.history.push_back(
      status_change_t{.from = order.status, .to = to, .changed_at = at});
  order.status = to;
  order.updated_at = at;
}

std::optional<std::string> validate_request(
    const purchase_order_request_t& request) {
  if (request.po_id && request.po_id->empty()) {
    return "po_id must not be empty when given";
  }
  if (request.supplier_id.empty()) {
    return "missing required field: supplier_id";
  }
  if (request.department_id.empty()) {
    return "missing required field: department_id";
  }
  if (request.requested_by.empty()) {
    return "missing required field: requested_by";
  }
  if (request.amount == 0) {
    return "amount must be positive";
  }
  if (request.items.empty()) {
    return "items must be a non-empty list";
  }
  return std::nullopt;
}

orchestrator::orchestrator(
    procura::schema::encoding::encoder<
        procura::schema::encoding::scale_encoder_tag>& encoder,
    procura::storage::storage<procura::storage::rocksdb_storage_tag>& storage,
    const procura::policy::policy_store& policy,
    const procura::routing::approval_router& router,
    procura::budget::reservation_manager& reservations)
    : encoder_{encoder},
      storage_{storage},
      policy_{policy},
      router_{router},
      reservations_{reservations} {}

order_result orchestrator::submit(const purchase_order_request_t& request) {
  if (auto problem = validate_request(request)) {
    return make_result(result_code_t::invalid_request, std::move(*problem),
                       kSubmitCodespace);
  }

  auto po_id = request.po_id ? *request.po_id : next_po_id();
  auto lock = orders_.lock(po_id);
  if (find(po_id)) {
    return make_result(result_code_t::invalid_request,
                       fmt::format("order '{}' already exists", po_id),
                       kSubmitCodespace);
  }

  auto now = now_milliseconds();
  auto order = purchase_order_state_t{};
  order.po_id = po_id;
  order.department_id = request.department_id;
  order.supplier_id = request.supplier_id;
  order.amount = request.amount;
  order.requested_by = request.requested_by;
  order.items = request.items;
  order.status = po_status_t::draft;
  order.created_at = now;
  order.updated_at = now;

  spdlog::info("Order '{}' submitted by '{}' for {} from '{}'", po_id,
               request.requested_by, format_amount(request.amount),
               request.supplier_id);
  return route_and_reserve(std::move(order), kSubmitCodespace);
}

order_result orchestrator::route_and_reserve(purchase_order_state_t order,
                                             const std::string_view codespace) {
  auto now = now_milliseconds();
  auto routed = router_.route(order.supplier_id, order.amount, now);
  if (routed.code != result_code_t::ok) {
    // Nothing is written: a fresh draft is dropped, a parked order stays put.
    if (order.status == po_status_t::draft) {
      return make_result(routed.code, std::move(routed.log), codespace);
    }
    return make_result(routed.code, std::move(routed.log), codespace,
                       std::move(order));
  }

  advance(order, po_status_t::routed, now);
  order.routing = std::move(routed.decision);
  order.reason = order.routing->reason;

  if (order.routing->outcome == routing_outcome_t::blocked) {
    advance(order, po_status_t::blocked, now);
    save(order);
    spdlog::warn("Order '{}' blocked: {}", order.po_id, order.reason);
    return make_result(result_code_t::blocked, order.reason, codespace,
                       std::move(order));
  }

  auto held = order;
  held.reservation_id = procura::budget::make_reservation_id(order.po_id);
  advance(held, po_status_t::reserved, now);
  auto auto_approved =
      held.routing->outcome == routing_outcome_t::auto_approved;
  advance(held,
          auto_approved ? po_status_t::approved
                        : po_status_t::awaiting_approval,
          now);

  auto reserved = reservations_.reserve(order.department_id, order.amount,
                                        order.po_id, stage(held));
  switch (reserved.outcome) {
    case procura::budget::reserve_outcome_t::reserved:
      break;
    case procura::budget::reserve_outcome_t::insufficient_budget:
    case procura::budget::reserve_outcome_t::budget_missing: {
      auto missing = reserved.outcome ==
                     procura::budget::reserve_outcome_t::budget_missing;
      advance(order, po_status_t::pending_budget, now);
      order.reason =
          missing ? fmt::format("no budget for department '{}'",
                                order.department_id)
                  : fmt::format("insufficient budget: requested {}, available {}",
                                format_amount(order.amount),
                                format_amount(reserved.available));
      save(order);
      spdlog::warn("Order '{}' pending budget: {}", order.po_id, order.reason);
      return make_result(missing ? result_code_t::not_found
                                 : result_code_t::insufficient_budget,
                         order.reason, codespace, std::move(order));
    }
    case procura::budget::reserve_outcome_t::invalid_amount:
      return make_result(result_code_t::invalid_request,
                         "amount must be positive", codespace);
    case procura::budget::reserve_outcome_t::duplicate:
      throw procura::common::invariant_violation{fmt::format(
          "order '{}' already holds reservation '{}' before reserving",
          order.po_id, *held.reservation_id)};
  }

  spdlog::info("Order '{}' reserved; {}", held.po_id,
               auto_approved ? "auto-approved" : "awaiting approval");
  if (auto_approved) {
    return finish_approved(std::move(held), codespace);
  }
  return make_result(result_code_t::ok, held.reason, codespace,
                     std::move(held));
}

order_result orchestrator::finish_approved(purchase_order_state_t order,
                                           const std::string_view codespace) {
  advance(order, po_status_t::consumed, now_milliseconds());
  auto settled = reservations_.consume(*order.reservation_id, stage(order));
  if (settled.outcome != procura::budget::settle_outcome_t::settled) {
    throw procura::common::invariant_violation{fmt::format(
        "approved order '{}' could not consume reservation '{}': {}",
        order.po_id, *order.reservation_id, to_string(settled.outcome))};
  }
  spdlog::info("Order '{}' approved and consumed {}", order.po_id,
               format_amount(order.amount));
  return make_result(result_code_t::ok, order.reason, codespace,
                     std::move(order));
}

order_result orchestrator::record_action(const po_id_t& po_id,
                                         const approver_role_t& role,
                                         const approval_decision_t decision) {
  auto lock = orders_.lock(po_id);
  auto order = find(po_id);
  if (!order) {
    return make_result(result_code_t::not_found,
                       fmt::format("order '{}' not found", po_id),
                       kActionCodespace);
  }
  if (order->status != po_status_t::awaiting_approval) {
    return make_result(
        result_code_t::invalid_transition,
        fmt::format("order '{}' is {}, not awaiting approval", po_id,
                    to_string(order->status)),
        kActionCodespace, std::move(order));
  }
  auto now = now_milliseconds();
  if (router_.escalate_inactive(*order->routing)) {
    order->reason = order->routing->reason;
    order->updated_at = now;
    save(*order);
    spdlog::warn("Order '{}' re-routed: {}", po_id, order->reason);
  }

  const auto& required = order->routing->required_roles;
  if (std::find(std::begin(required), std::end(required), role) ==
      std::end(required)) {
    return make_result(
        result_code_t::role_not_required,
        fmt::format("role '{}' is not required for order '{}'", role, po_id),
        kActionCodespace, std::move(order));
  }
  auto approver = policy_.find_approver(role);
  if (!approver || !approver->active) {
    return make_result(result_code_t::approver_inactive,
                       fmt::format("approver role '{}' is not active", role),
                       kActionCodespace, std::move(order));
  }

  if (decision == approval_decision_t::approve) {
    auto repeated = has_approved(*order, role);
    if (!repeated) {
      order->actions.push_back(approver_action_t{
          .role = role, .decision = decision, .recorded_at = now});
      spdlog::info("Order '{}' approved by '{}'", po_id, role);
    }
    if (!all_approved(*order)) {
      if (repeated) {
        return make_result(result_code_t::ok,
                           fmt::format("'{}' already approved", role),
                           kActionCodespace, std::move(order));
      }
      order->updated_at = now;
      save(*order);
      return make_result(result_code_t::ok,
                         fmt::format("approval recorded for '{}'", role),
                         kActionCodespace, std::move(order));
    }
    // Escalation can leave a repeated approval as the last one outstanding.
    advance(*order, po_status_t::approved, now);
    order->reason = "all required approvers approved";
    return finish_approved(std::move(*order), kActionCodespace);
  }

  order->actions.push_back(approver_action_t{
      .role = role, .decision = decision, .recorded_at = now});
  advance(*order, po_status_t::rejected, now);
  advance(*order, po_status_t::released, now);
  order->reason = fmt::format("rejected by '{}'", role);
  auto settled = reservations_.release(*order->reservation_id, stage(*order));
  if (settled.outcome != procura::budget::settle_outcome_t::settled) {
    throw procura::common::invariant_violation{fmt::format(
        "rejected order '{}' could not release reservation '{}': {}", po_id,
        *order->reservation_id, to_string(settled.outcome))};
  }
  spdlog::info("Order '{}' rejected by '{}'; reservation released", po_id,
               role);
  return make_result(result_code_t::ok, order->reason, kActionCodespace,
                     std::move(order));
}

order_result orchestrator::cancel(const po_id_t& po_id,
                                  const std::string_view reason) {
  auto lock = orders_.lock(po_id);
  auto order = find(po_id);
  if (!order) {
    return make_result(result_code_t::not_found,
                       fmt::format("order '{}' not found", po_id),
                       kCancelCodespace);
  }
  if (is_terminal(order->status)) {
    return make_result(result_code_t::already_terminal,
                       fmt::format("order '{}' is already {}", po_id,
                                   to_string(order->status)),
                       kCancelCodespace, std::move(order));
  }
  if (!is_cancellable(order->status)) {
    return make_result(
        result_code_t::invalid_transition,
        fmt::format("order '{}' cannot be cancelled while {}", po_id,
                    to_string(order->status)),
        kCancelCodespace, std::move(order));
  }

  advance(*order, po_status_t::released, now_milliseconds());
  order->reason = reason.empty() ? std::string{"cancelled"}
                                 : fmt::format("cancelled: {}", reason);

  auto reservation =
      order->reservation_id
          ? reservations_.find_reservation(*order->reservation_id)
          : std::nullopt;
  if (reservation &&
      reservation->status == reservation_status_t::active) {
    auto settled = reservations_.release(*order->reservation_id, stage(*order));
    if (settled.outcome != procura::budget::settle_outcome_t::settled) {
      throw procura::common::invariant_violation{fmt::format(
          "cancelled order '{}' could not release reservation '{}': {}",
          po_id, *order->reservation_id, to_string(settled.outcome))};
    }
  } else {
    save(*order);
  }
  spdlog::info("Order '{}' cancelled", po_id);
  return make_result(result_code_t::ok, order->reason, kCancelCodespace,
                     std::move(order));
}

order_result orchestrator::retry_reservation(const po_id_t& po_id) {
  auto lock = orders_.lock(po_id);
  auto order = find(po_id);
  if (!order) {
    return make_result(result_code_t::not_found,
                       fmt::format("order '{}' not found", po_id),
                       kRetryCodespace);
  }
  if (order->status != po_status_t::pending_budget) {
    return make_result(
        result_code_t::invalid_transition,
        fmt::format("order '{}' is {}, not pending budget", po_id,
                    to_string(order->status)),
        kRetryCodespace, std::move(order));
  }
  spdlog::info("Retrying reservation for order '{}'", po_id);
  return route_and_reserve(std::move(*order), kRetryCodespace);
}

std::optional<purchase_order_state_t> orchestrator::find(
    const po_id_t& po_id) const {
  return storage_.get<purchase_order_state_t>(
      encoder_, key::make_purchase_order_key(encoder_, po_id));
}

po_id_t orchestrator::next_po_id() {
  // The sequence restarts with the process, so skip ids an earlier run stored.
  while (true) {
    auto po_id = fmt::format("PO-{:%Y%m%d%H%M%S}-{:04}",
                             fmt::gmtime(std::time(nullptr)), ++sequence_);
    if (!find(po_id)) {
      return po_id;
    }
  }
}

void orchestrator::save(const purchase_order_state_t& order) {
  storage_.commit(stage(order));
}

procura::storage::write_set orchestrator::stage(
    const purchase_order_state_t& order) {
  auto writes = procura::storage::write_set{};
  writes.put(encoder_, key::make_purchase_order_key(encoder_, order.po_id),
             order);
  return writes;
}

}  // namespace procura::orchestration
