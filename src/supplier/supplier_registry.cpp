#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <procura/common/invariant_violation.hpp>
#include <procura/schema/key/engine_keys.hpp>
#include <procura/supplier/supplier_registry.hpp>

using namespace procura::schema;

namespace procura::supplier {

supplier_registry::supplier_registry(
    procura::schema::encoding::encoder<
        procura::schema::encoding::scale_encoder_tag>& encoder,
    procura::storage::storage<procura::storage::rocksdb_storage_tag>& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<supplier_state_t> supplier_registry::find_supplier(
    const supplier_id_t& supplier_id) const {
  return storage_.get<supplier_state_t>(
      encoder_, key::make_supplier_key(encoder_, supplier_id));
}

std::vector<supplier_state_t> supplier_registry::list_approved_suppliers(
    const std::optional<std::string>& category) const {
  auto suppliers = std::vector<supplier_state_t>{};
  auto prefix = key::make_prefix_key(encoder_, key::kSupplierKeyPrefix);
  for (const auto& [_, value] : storage_.list_by_prefix(prefix)) {
    auto supplier = encoder_.decode<supplier_state_t>(make_bytes_view(value));
    if (supplier.status != supplier_status_t::approved) {
      continue;
    }
    if (category &&
        std::find(std::begin(supplier.categories),
                  std::end(supplier.categories),
                  *category) == std::end(supplier.categories)) {
      continue;
    }
    suppliers.push_back(std::move(supplier));
  }
  // SCALE prefixes ids with their length, so key order is not id order.
  std::sort(std::begin(suppliers), std::end(suppliers),
            [](const auto& lhs, const auto& rhs) {
              return lhs.supplier_id < rhs.supplier_id;
            });
  return suppliers;
}

void supplier_registry::upsert_supplier(const supplier_state_t& supplier) {
  if (supplier.rating_hundredths > kMaxRatingHundredths) {
    throw procura::common::invariant_violation{fmt::format(
        "supplier '{}' rating {} is outside 0..{}", supplier.supplier_id,
        supplier.rating_hundredths, kMaxRatingHundredths)};
  }
  storage_.put(encoder_, key::make_supplier_key(encoder_, supplier.supplier_id),
               supplier);
  spdlog::info("Supplier '{}' stored with status {}", supplier.supplier_id,
               to_string(supplier.status));
}

}  // namespace procura::supplier
