#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <procura/budget/budget_ledger.hpp>
#include <procura/common/invariant_violation.hpp>
#include <procura/schema/key/engine_keys.hpp>

using namespace procura::schema;

namespace procura::budget {

void validate_budget(const budget_state_t& budget) {
  if (budget.spent > budget.allocated ||
      budget.reserved > budget.allocated - budget.spent) {
    throw procura::common::invariant_violation{fmt::format(
        "budget '{}' violates spent + reserved <= allocated (allocated {}, "
        "spent {}, reserved {})",
        budget.department_id, budget.allocated, budget.spent,
        budget.reserved)};
  }
}

amount_t available_amount(const budget_state_t& budget) {
  return budget.allocated - budget.spent - budget.reserved;
}

budget_ledger::budget_ledger(
    procura::schema::encoding::encoder<
        procura::schema::encoding::scale_encoder_tag>& encoder,
    procura::storage::storage<procura::storage::rocksdb_storage_tag>& storage,
    const uint16_t fiscal_year)
    : encoder_{encoder}, storage_{storage}, fiscal_year_{fiscal_year} {}

std::optional<budget_state_t> budget_ledger::find_budget(
    const department_id_t& department_id) const {
  return storage_.get<budget_state_t>(
      encoder_, key::make_budget_key(encoder_, department_id));
}

std::optional<budget_state_t> budget_ledger::find_current_budget(
    const department_id_t& department_id) const {
  auto budget = find_budget(department_id);
  if (budget && fiscal_year_ != 0 && budget->fiscal_year != fiscal_year_) {
    spdlog::warn("Budget for '{}' is for fiscal year {}, expected {}",
                 department_id, budget->fiscal_year, fiscal_year_);
    return std::nullopt;
  }
  return budget;
}

std::optional<availability> budget_ledger::check_availability(
    const department_id_t& department_id,
    const amount_t amount) const {
  auto budget = find_current_budget(department_id);
  if (!budget) {
    return std::nullopt;
  }
  validate_budget(*budget);
  auto remaining = available_amount(*budget);
  return availability{
      .available = amount <= remaining, .requested = amount,
      .remaining = remaining};
}

std::optional<budget_summary> budget_ledger::summary(
    const department_id_t& department_id) const {
  auto budget = find_budget(department_id);
  if (!budget) {
    return std::nullopt;
  }
  validate_budget(*budget);
  auto utilization = 0.0;
  if (budget->allocated > 0) {
    utilization = std::round(static_cast<double>(budget->spent) /
                             static_cast<double>(budget->allocated) * 10000.0) /
                  100.0;
  }
  return budget_summary{.department_id = budget->department_id,
                        .name = budget->name,
                        .fiscal_year = budget->fiscal_year,
                        .allocated = budget->allocated,
                        .spent = budget->spent,
                        .reserved = budget->reserved,
                        .available = available_amount(*budget),
                        .utilization_percent = utilization};
}

void budget_ledger::upsert_budget(const budget_state_t& budget) {
  auto lock = lock_department(budget.department_id);
  auto budget_key = key::make_budget_key(encoder_, budget.department_id);
  auto stored = budget;
  // spent and reserved belong to the reservation manager once a row exists.
  if (auto existing = storage_.get<budget_state_t>(encoder_, budget_key)) {
    stored = *existing;
    stored.name = budget.name;
    stored.allocated = budget.allocated;
    stored.fiscal_year = budget.fiscal_year;
    stored.manager_email = budget.manager_email;
  }
  validate_budget(stored);
  storage_.put(encoder_, budget_key, stored);
  spdlog::info("Budget for '{}' FY{} stored: allocated {}, spent {}, reserved {}",
               stored.department_id, stored.fiscal_year,
               format_amount(stored.allocated), format_amount(stored.spent),
               format_amount(stored.reserved));
}

procura::common::keyed_mutex<department_id_t>::guard
budget_ledger::lock_department(const department_id_t& department_id) {
  return departments_.lock(department_id);
}

}  // namespace procura::budget
