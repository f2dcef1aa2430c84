#pragma once

#include <procura/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace procura::schema {

enum class routing_outcome_t : uint8_t {
  auto_approved = 0,
  requires_approval = 1,
  blocked = 2,
};

inline constexpr auto kRoutingOutcomeMappings = std::array{
    std::pair<std::string_view, routing_outcome_t>{"auto_approved", routing_outcome_t::auto_approved},
    std::pair<std::string_view, routing_outcome_t>{"requires_approval", routing_outcome_t::requires_approval},
    std::pair<std::string_view, routing_outcome_t>{"blocked", routing_outcome_t::blocked},
};

template <>
inline std::optional<routing_outcome_t> try_from_string<routing_outcome_t>(
    const std::string_view value) {
  return from_string(value, kRoutingOutcomeMappings);
}

inline constexpr std::string_view to_string(const routing_outcome_t value) {
  return to_string(value, kRoutingOutcomeMappings).value_or("unknown");
}

}  // namespace procura::schema
