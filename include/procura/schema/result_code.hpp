#pragma once

#include <procura/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Engine result taxonomy. Everything except ok and already_terminal is a
// refusal that leaves state unchanged, except insufficient_budget and
// blocked which also report the order's resting state.
namespace procura::schema {

enum class result_code_t : uint32_t {
  ok = 0,
  not_found = 1,
  blocked = 2,
  insufficient_budget = 3,
  already_terminal = 4,
  invalid_transition = 5,
  invalid_request = 6,
  role_not_required = 7,
  approver_inactive = 8,
};

inline constexpr auto kResultCodeMappings = std::array{
    std::pair<std::string_view, result_code_t>{"ok", result_code_t::ok},
    std::pair<std::string_view, result_code_t>{"not_found",
                                               result_code_t::not_found},
    std::pair<std::string_view, result_code_t>{"blocked",
                                               result_code_t::blocked},
    std::pair<std::string_view, result_code_t>{
        "insufficient_budget", result_code_t::insufficient_budget},
    std::pair<std::string_view, result_code_t>{
        "already_terminal", result_code_t::already_terminal},
    std::pair<std::string_view, result_code_t>{
        "invalid_transition", result_code_t::invalid_transition},
    std::pair<std::string_view, result_code_t>{"invalid_request",
                                               result_code_t::invalid_request},
    std::pair<std::string_view, result_code_t>{
        "role_not_required", result_code_t::role_not_required},
    std::pair<std::string_view, result_code_t>{
        "approver_inactive", result_code_t::approver_inactive},
};

template <>
inline std::optional<result_code_t> try_from_string<result_code_t>(
    const std::string_view value) {
  return from_string(value, kResultCodeMappings);
}

inline constexpr std::string_view to_string(const result_code_t value) {
  return to_string(value, kResultCodeMappings).value_or("unknown");
}

}  // namespace procura::schema
