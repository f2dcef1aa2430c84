#pragma once

#include <procura/schema/encoding/scale/encoder.hpp>
#include <procura/schema/primitives.hpp>
#include <procura/schema/supplier_state.hpp>
#include <procura/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace procura::supplier {

/// Ratings are stored in hundredths: 500 is 5.00.
inline constexpr uint16_t kMaxRatingHundredths{500};

/// Vendor master lookups used by routing.
class supplier_registry final {
 public:
  explicit supplier_registry(
      procura::schema::encoding::encoder<
          procura::schema::encoding::scale_encoder_tag>& encoder,
      procura::storage::storage<procura::storage::rocksdb_storage_tag>&
          storage);

  std::optional<procura::schema::supplier_state_t> find_supplier(
      const procura::schema::supplier_id_t& supplier_id) const;

  /// Approved suppliers ordered by id, optionally restricted to a category.
  std::vector<procura::schema::supplier_state_t> list_approved_suppliers(
      const std::optional<std::string>& category = std::nullopt) const;

  /// Ratings above kMaxRatingHundredths are rejected with
  /// common::invariant_violation.
  void upsert_supplier(const procura::schema::supplier_state_t& supplier);

 private:
  procura::schema::encoding::encoder<
      procura::schema::encoding::scale_encoder_tag>& encoder_;
  procura::storage::storage<procura::storage::rocksdb_storage_tag>& storage_;
};

}  // namespace procura::supplier
