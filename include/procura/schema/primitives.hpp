#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace procura::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;

/// Monetary amount in minor currency units (cents). Single currency.
using amount_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;

using supplier_id_t = std::string;
using department_id_t = std::string;
using approver_role_t = std::string;
using po_id_t = std::string;
using reservation_id_t = std::string;
using rule_id_t = uint32_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Render minor units as a dollar string, e.g. 123456 -> "$1,234.56".
std::string format_amount(amount_t amount);

timestamp_milliseconds_t now_milliseconds();

}  // namespace procura::schema
