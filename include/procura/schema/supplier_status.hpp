#pragma once

#include <procura/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Supplier vetting status. Only approved suppliers are processed normally.
namespace procura::schema {

enum class supplier_status_t : uint8_t {
  approved = 0,
  pending = 1,
  suspended = 2,
};

inline constexpr auto kSupplierStatusMappings = std::array{
    std::pair<std::string_view, supplier_status_t>{"approved", supplier_status_t::approved},
    std::pair<std::string_view, supplier_status_t>{"pending", supplier_status_t::pending},
    std::pair<std::string_view, supplier_status_t>{"suspended", supplier_status_t::suspended},
};

template <>
inline std::optional<supplier_status_t> try_from_string<supplier_status_t>(
    const std::string_view value) {
  return from_string(value, kSupplierStatusMappings);
}

inline constexpr std::string_view to_string(const supplier_status_t value) {
  return to_string(value, kSupplierStatusMappings).value_or("unknown");
}

}  // namespace procura::schema
