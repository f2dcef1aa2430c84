#pragma once

#include <procura/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Purchase order lifecycle. See orchestration/transitions.hpp for the
// permitted edges.
namespace procura::schema {

enum class po_status_t : uint8_t {
  draft = 0,
  routed = 1,
  blocked = 2,
  pending_budget = 3,
  reserved = 4,
  awaiting_approval = 5,
  approved = 6,
  rejected = 7,
  consumed = 8,
  released = 9,
};

inline constexpr auto kPoStatusMappings = std::array{
    std::pair<std::string_view, po_status_t>{"draft", po_status_t::draft},
    std::pair<std::string_view, po_status_t>{"routed", po_status_t::routed},
    std::pair<std::string_view, po_status_t>{"blocked", po_status_t::blocked},
    std::pair<std::string_view, po_status_t>{"pending_budget", po_status_t::pending_budget},
    std::pair<std::string_view, po_status_t>{"reserved", po_status_t::reserved},
    std::pair<std::string_view, po_status_t>{"awaiting_approval", po_status_t::awaiting_approval},
    std::pair<std::string_view, po_status_t>{"approved", po_status_t::approved},
    std::pair<std::string_view, po_status_t>{"rejected", po_status_t::rejected},
    std::pair<std::string_view, po_status_t>{"consumed", po_status_t::consumed},
    std::pair<std::string_view, po_status_t>{"released", po_status_t::released},
};

template <>
inline std::optional<po_status_t> try_from_string<po_status_t>(
    const std::string_view value) {
  return from_string(value, kPoStatusMappings);
}

inline constexpr std::string_view to_string(const po_status_t value) {
  return to_string(value, kPoStatusMappings).value_or("unknown");
}

}  // namespace procura::schema
