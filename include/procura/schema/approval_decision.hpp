#pragma once

#include <procura/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace procura::schema {

enum class approval_decision_t : uint8_t {
  approve = 0,
  reject = 1,
};

inline constexpr auto kApprovalDecisionMappings = std::array{
    std::pair<std::string_view, approval_decision_t>{"approve", approval_decision_t::approve},
    std::pair<std::string_view, approval_decision_t>{"reject", approval_decision_t::reject},
};

template <>
inline std::optional<approval_decision_t> try_from_string<approval_decision_t>(
    const std::string_view value) {
  return from_string(value, kApprovalDecisionMappings);
}

inline constexpr std::string_view to_string(const approval_decision_t value) {
  return to_string(value, kApprovalDecisionMappings).value_or("unknown");
}

}  // namespace procura::schema
