#pragma once

#include <procura/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Reservation manager outcomes. These are expected results, not errors.
namespace procura::budget {

enum class reserve_outcome_t : uint8_t {
  reserved = 0,
  insufficient_budget = 1,
  budget_missing = 2,
  invalid_amount = 3,
  duplicate = 4,
};

enum class settle_outcome_t : uint8_t {
  settled = 0,
  already_terminal = 1,
  not_found = 2,
};

inline constexpr auto kReserveOutcomeMappings = std::array{
    std::pair<std::string_view, reserve_outcome_t>{"reserved",
                                                   reserve_outcome_t::reserved},
    std::pair<std::string_view, reserve_outcome_t>{
        "insufficient_budget", reserve_outcome_t::insufficient_budget},
    std::pair<std::string_view, reserve_outcome_t>{
        "budget_missing", reserve_outcome_t::budget_missing},
    std::pair<std::string_view, reserve_outcome_t>{
        "invalid_amount", reserve_outcome_t::invalid_amount},
    std::pair<std::string_view, reserve_outcome_t>{
        "duplicate", reserve_outcome_t::duplicate},
};

inline constexpr auto kSettleOutcomeMappings = std::array{
    std::pair<std::string_view, settle_outcome_t>{"settled",
                                                  settle_outcome_t::settled},
    std::pair<std::string_view, settle_outcome_t>{
        "already_terminal", settle_outcome_t::already_terminal},
    std::pair<std::string_view, settle_outcome_t>{"not_found",
                                                  settle_outcome_t::not_found},
};

inline constexpr std::string_view to_string(const reserve_outcome_t value) {
  return procura::schema::to_string(value, kReserveOutcomeMappings)
      .value_or("unknown");
}

inline constexpr std::string_view to_string(const settle_outcome_t value) {
  return procura::schema::to_string(value, kSettleOutcomeMappings)
      .value_or("unknown");
}

}  // namespace procura::budget
