#pragma once

#include <procura/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Budget reservation lifecycle. released and consumed are terminal.
namespace procura::schema {

enum class reservation_status_t : uint8_t {
  active = 0,
  released = 1,
  consumed = 2,
};

inline constexpr auto kReservationStatusMappings = std::array{
    std::pair<std::string_view, reservation_status_t>{"active", reservation_status_t::active},
    std::pair<std::string_view, reservation_status_t>{"released", reservation_status_t::released},
    std::pair<std::string_view, reservation_status_t>{"consumed", reservation_status_t::consumed},
};

template <>
inline std::optional<reservation_status_t> try_from_string<reservation_status_t>(
    const std::string_view value) {
  return from_string(value, kReservationStatusMappings);
}

inline constexpr std::string_view to_string(const reservation_status_t value) {
  return to_string(value, kReservationStatusMappings).value_or("unknown");
}

}  // namespace procura::schema
