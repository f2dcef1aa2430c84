#pragma once

#include <procura/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace procura::schema {

enum class risk_score_t : uint8_t {
  low = 0,
  medium = 1,
  high = 2,
};

inline constexpr auto kRiskScoreMappings = std::array{
    std::pair<std::string_view, risk_score_t>{"low", risk_score_t::low},
    std::pair<std::string_view, risk_score_t>{"medium", risk_score_t::medium},
    std::pair<std::string_view, risk_score_t>{"high", risk_score_t::high},
};

template <>
inline std::optional<risk_score_t> try_from_string<risk_score_t>(
    const std::string_view value) {
  return from_string(value, kRiskScoreMappings);
}

inline constexpr std::string_view to_string(const risk_score_t value) {
  return to_string(value, kRiskScoreMappings).value_or("unknown");
}

}  // namespace procura::schema
