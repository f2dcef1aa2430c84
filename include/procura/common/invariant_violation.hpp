#pragma once

#include <stdexcept>
#include <string>

namespace procura::common {

/// Raised when a budget mutation would leave `spent + reserved > allocated`
/// or underflow a balance, or when an order would take an edge missing from
/// the lifecycle table. Thrown before any write is issued, so the offending
/// transaction is abandoned whole.
class invariant_violation final : public std::logic_error {
 public:
  explicit invariant_violation(const std::string& message)
      : std::logic_error{message} {}
};

}  // namespace procura::common
