#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <procura/budget/reservation_manager.hpp>
#include <procura/common/invariant_violation.hpp>
#include <procura/schema/key/engine_keys.hpp>

using namespace procura::schema;

namespace procura::budget {

reservation_id_t make_reservation_id(const po_id_t& po_id) {
  return "RSV-" + po_id;
}

reservation_manager::reservation_manager(
    procura::schema::encoding::encoder<
        procura::schema::encoding::scale_encoder_tag>& encoder,
    procura::storage::storage<procura::storage::rocksdb_storage_tag>& storage,
    budget_ledger& ledger)
    : encoder_{encoder}, storage_{storage}, ledger_{ledger} {}

reserve_result reservation_manager::reserve(
    const department_id_t& department_id,
    const amount_t amount,
    const po_id_t& po_id,
    const procura::storage::write_set& companion) {
  if (amount == 0) {
    return reserve_result{.outcome = reserve_outcome_t::invalid_amount};
  }

  auto lock = ledger_.lock_department(department_id);

  auto reservation_id = make_reservation_id(po_id);
  auto reservation_key = key::make_reservation_key(encoder_, reservation_id);
  auto existing = storage_.get<reservation_state_t>(encoder_, reservation_key);
  if (existing) {
    spdlog::warn("Purchase order '{}' already holds reservation '{}'", po_id,
                 reservation_id);
    return reserve_result{.outcome = reserve_outcome_t::duplicate,
                          .reservation = std::move(existing)};
  }

  auto budget = ledger_.find_current_budget(department_id);
  if (!budget) {
    spdlog::warn("No budget for department '{}'", department_id);
    return reserve_result{.outcome = reserve_outcome_t::budget_missing};
  }
  validate_budget(*budget);

  auto available = available_amount(*budget);
  if (amount > available) {
    spdlog::warn("Insufficient budget in '{}': requested {}, available {}",
                 department_id, format_amount(amount),
                 format_amount(available));
    return reserve_result{.outcome = reserve_outcome_t::insufficient_budget,
                          .available = available};
  }

  budget->reserved += amount;
  validate_budget(*budget);

  auto reservation = reservation_state_t{};
  reservation.reservation_id = reservation_id;
  reservation.po_id = po_id;
  reservation.department_id = department_id;
  reservation.amount = amount;
  reservation.status = reservation_status_t::active;
  reservation.created_at = now_milliseconds();

  auto writes = procura::storage::write_set{};
  writes.put(encoder_, key::make_budget_key(encoder_, department_id), *budget);
  writes.put(encoder_, reservation_key, reservation);
  writes.merge(companion);
  storage_.commit(writes);

  spdlog::info("Reserved {} from '{}' for '{}' ({} left)",
               format_amount(amount), department_id, po_id,
               format_amount(available_amount(*budget)));
  return reserve_result{.outcome = reserve_outcome_t::reserved,
                        .reservation = std::move(reservation),
                        .available = available_amount(*budget)};
}

settle_result reservation_manager::release(
    const reservation_id_t& reservation_id,
    const procura::storage::write_set& companion) {
  return settle(reservation_id, reservation_status_t::released, companion);
}

settle_result reservation_manager::consume(
    const reservation_id_t& reservation_id,
    const procura::storage::write_set& companion) {
  return settle(reservation_id, reservation_status_t::consumed, companion);
}

settle_result reservation_manager::settle(
    const reservation_id_t& reservation_id,
    const reservation_status_t target,
    const procura::storage::write_set& companion) {
  auto reservation_key = key::make_reservation_key(encoder_, reservation_id);
  auto unlocked = storage_.get<reservation_state_t>(encoder_, reservation_key);
  if (!unlocked) {
    return settle_result{.outcome = settle_outcome_t::not_found};
  }

  // Re-read under the lock; a concurrent settle may have won.
  auto lock = ledger_.lock_department(unlocked->department_id);
  auto reservation =
      storage_.get<reservation_state_t>(encoder_, reservation_key);
  if (!reservation) {
    return settle_result{.outcome = settle_outcome_t::not_found};
  }
  if (reservation->status != reservation_status_t::active) {
    return settle_result{.outcome = settle_outcome_t::already_terminal,
                         .reservation = std::move(reservation)};
  }

  auto budget = ledger_.find_budget(reservation->department_id);
  if (!budget) {
    throw procura::common::invariant_violation{
        fmt::format("reservation '{}' references missing budget '{}'",
                    reservation_id, reservation->department_id)};
  }
  validate_budget(*budget);
  if (budget->reserved < reservation->amount) {
    throw procura::common::invariant_violation{fmt::format(
        "budget '{}' holds {} reserved, less than reservation '{}' of {}",
        budget->department_id, budget->reserved, reservation_id,
        reservation->amount)};
  }

  budget->reserved -= reservation->amount;
  if (target == reservation_status_t::consumed) {
    budget->spent += reservation->amount;
  }
  validate_budget(*budget);

  reservation->status = target;
  reservation->settled_at = now_milliseconds();

  auto writes = procura::storage::write_set{};
  writes.put(encoder_, key::make_budget_key(encoder_, budget->department_id),
             *budget);
  writes.put(encoder_, reservation_key, *reservation);
  writes.merge(companion);
  storage_.commit(writes);

  spdlog::info("Reservation '{}' {} ({} against '{}')", reservation_id,
               to_string(target), format_amount(reservation->amount),
               budget->department_id);
  return settle_result{.outcome = settle_outcome_t::settled,
                       .reservation = std::move(reservation)};
}

std::optional<reservation_state_t> reservation_manager::find_reservation(
    const reservation_id_t& reservation_id) const {
  return storage_.get<reservation_state_t>(
      encoder_, key::make_reservation_key(encoder_, reservation_id));
}

std::optional<reservation_state_t> reservation_manager::find_reservation_for_po(
    const po_id_t& po_id) const {
  return find_reservation(make_reservation_id(po_id));
}

}  // namespace procura::budget
