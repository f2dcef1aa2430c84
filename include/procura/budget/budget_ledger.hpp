#pragma once

#include <procura/common/keyed_mutex.hpp>
#include <procura/schema/budget_state.hpp>
#include <procura/schema/encoding/scale/encoder.hpp>
#include <procura/schema/primitives.hpp>
#include <procura/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace procura::budget {

struct availability final {
  bool available{false};
  procura::schema::amount_t requested{};
  procura::schema::amount_t remaining{};
};

struct budget_summary final {
  procura::schema::department_id_t department_id;
  std::string name;
  uint16_t fiscal_year{};
  procura::schema::amount_t allocated{};
  procura::schema::amount_t spent{};
  procura::schema::amount_t reserved{};
  procura::schema::amount_t available{};
  double utilization_percent{};
};

/// Throw common::invariant_violation unless spent + reserved <= allocated.
void validate_budget(const procura::schema::budget_state_t& budget);

/// allocated - spent - reserved. The budget must already be valid.
procura::schema::amount_t available_amount(
    const procura::schema::budget_state_t& budget);

/// Departmental budgets and the per-department lock that serializes every
/// balance mutation.
///
/// `fiscal_year` of 0 accepts budgets of any year; otherwise budgets of other
/// years are treated as missing by availability checks and reservations.
class budget_ledger final {
 public:
  explicit budget_ledger(
      procura::schema::encoding::encoder<
          procura::schema::encoding::scale_encoder_tag>& encoder,
      procura::storage::storage<procura::storage::rocksdb_storage_tag>&
          storage,
      uint16_t fiscal_year = 0);

  std::optional<procura::schema::budget_state_t> find_budget(
      const procura::schema::department_id_t& department_id) const;

  /// Budget for the configured fiscal year, if any.
  std::optional<procura::schema::budget_state_t> find_current_budget(
      const procura::schema::department_id_t& department_id) const;

  std::optional<availability> check_availability(
      const procura::schema::department_id_t& department_id,
      procura::schema::amount_t amount) const;

  std::optional<budget_summary> summary(
      const procura::schema::department_id_t& department_id) const;

  /// Load a budget, or update the allocation and descriptive fields of an
  /// existing one. Stored spent and reserved balances are kept. Budgets that
  /// would break spent + reserved <= allocated are rejected with
  /// common::invariant_violation.
  void upsert_budget(const procura::schema::budget_state_t& budget);

  /// Hold the department lock for the lifetime of the returned guard.
  procura::common::keyed_mutex<procura::schema::department_id_t>::guard
  lock_department(const procura::schema::department_id_t& department_id);

 private:
  procura::schema::encoding::encoder<
      procura::schema::encoding::scale_encoder_tag>& encoder_;
  procura::storage::storage<procura::storage::rocksdb_storage_tag>& storage_;
  uint16_t fiscal_year_{};
  procura::common::keyed_mutex<procura::schema::department_id_t> departments_;
};

}  // namespace procura::budget
