#pragma once

#include <procura/budget/budget_ledger.hpp>
#include <procura/budget/outcome.hpp>
#include <procura/schema/encoding/scale/encoder.hpp>
#include <procura/schema/primitives.hpp>
#include <procura/schema/reservation_state.hpp>
#include <procura/storage/rocksdb/storage.hpp>
#include <optional>

namespace procura::budget {

struct reserve_result final {
  reserve_outcome_t outcome{reserve_outcome_t::budget_missing};
  std::optional<procura::schema::reservation_state_t> reservation;
  /// Funds left in the department after the call.
  procura::schema::amount_t available{};
};

struct settle_result final {
  settle_outcome_t outcome{settle_outcome_t::not_found};
  std::optional<procura::schema::reservation_state_t> reservation;
};

/// Reservation id for the hold placed on behalf of a purchase order. One
/// order owns at most one reservation.
procura::schema::reservation_id_t make_reservation_id(
    const procura::schema::po_id_t& po_id);

/// The only writer of budget balances.
///
/// Every operation runs under the department lock and lands in one write
/// batch together with the caller's `companion` writes. Companion writes are
/// committed only when the operation changes the ledger (reserved or
/// settled); otherwise nothing is written.
class reservation_manager final {
 public:
  explicit reservation_manager(
      procura::schema::encoding::encoder<
          procura::schema::encoding::scale_encoder_tag>& encoder,
      procura::storage::storage<procura::storage::rocksdb_storage_tag>&
          storage,
      budget_ledger& ledger);

  /// Hold `amount` against the department if it is available now. Never
  /// waits for funds.
  reserve_result reserve(
      const procura::schema::department_id_t& department_id,
      procura::schema::amount_t amount,
      const procura::schema::po_id_t& po_id,
      const procura::storage::write_set& companion = {});

  /// Return an active hold to the department.
  settle_result release(
      const procura::schema::reservation_id_t& reservation_id,
      const procura::storage::write_set& companion = {});

  /// Recognize an active hold as spend.
  settle_result consume(
      const procura::schema::reservation_id_t& reservation_id,
      const procura::storage::write_set& companion = {});

  std::optional<procura::schema::reservation_state_t> find_reservation(
      const procura::schema::reservation_id_t& reservation_id) const;

  std::optional<procura::schema::reservation_state_t> find_reservation_for_po(
      const procura::schema::po_id_t& po_id) const;

 private:
  settle_result settle(const procura::schema::reservation_id_t& reservation_id,
                       procura::schema::reservation_status_t target,
                       const procura::storage::write_set& companion);

  procura::schema::encoding::encoder<
      procura::schema::encoding::scale_encoder_tag>& encoder_;
  procura::storage::storage<procura::storage::rocksdb_storage_tag>& storage_;
  budget_ledger& ledger_;
};

}  // namespace procura::budget
