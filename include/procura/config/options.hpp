#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace procura::config {

/// Runtime configuration for procurad.
struct options final {
  std::string db_path{"procura.db"};
  std::string grpc_address{"0.0.0.0:50051"};
  /// Role every escalated order is routed to.
  std::string fallback_role{"director"};
  /// 0 accepts budgets of any fiscal year.
  uint16_t fiscal_year{};
  std::string log_level{"info"};
  std::string log_file{"procurad.log"};
  std::optional<std::string> config_file;
  bool help{false};
  /// Rendered option descriptions, filled when help was requested.
  std::string usage;
};

struct parse_error final {
  std::string message;
};

/// Parse the command line, then the INI file named by --config if any.
/// Command line values win over file values.
std::variant<options, parse_error> parse_options(int argc, const char* const argv[]);

}  // namespace procura::config
