#pragma once

#include <procura/schema/approval_rule.hpp>
#include <procura/schema/approver_state.hpp>
#include <procura/schema/encoding/scale/encoder.hpp>
#include <procura/schema/primitives.hpp>
#include <procura/storage/rocksdb/storage.hpp>
#include <mutex>
#include <optional>
#include <vector>

namespace procura::policy {

/// Result of an approval matrix lookup.
///
/// When `manual_escalation` is set no bracket covers the amount and `rule`
/// holds the highest active bracket, if the matrix has one.
struct rule_match final {
  bool manual_escalation{false};
  std::optional<procura::schema::approval_rule_t> rule;
};

/// Read side of the approval matrix and the approver directory.
///
/// Rules are stored under big-endian (max_amount, rule_id) keys so a lookup
/// is a single seek followed by a short forward scan.
class policy_store final {
 public:
  explicit policy_store(
      procura::schema::encoding::encoder<
          procura::schema::encoding::scale_encoder_tag>& encoder,
      procura::storage::storage<procura::storage::rocksdb_storage_tag>&
          storage);

  /// Select the tightest active, unexpired bracket covering `amount`.
  ///
  /// Ties on max_amount prefer the larger approver set, then the lower
  /// rule_id.
  rule_match find_rule(procura::schema::amount_t amount,
                       procura::schema::timestamp_milliseconds_t now) const;

  /// Every stored rule ordered by (max_amount, rule_id), inactive included.
  std::vector<procura::schema::approval_rule_t> list_rules() const;

  std::optional<procura::schema::approver_state_t> find_approver(
      const procura::schema::approver_role_t& role) const;

  /// Insert or replace a rule. A rule whose max_amount changed is moved to
  /// its new key in the same batch. Rule writers are serialized.
  void upsert_rule(const procura::schema::approval_rule_t& rule);

  void upsert_approver(const procura::schema::approver_state_t& approver);

 private:
  procura::schema::encoding::encoder<
      procura::schema::encoding::scale_encoder_tag>& encoder_;
  procura::storage::storage<procura::storage::rocksdb_storage_tag>& storage_;
  std::mutex rules_mutex_;
};

/// True when the rule may currently be used for routing.
bool is_usable(const procura::schema::approval_rule_t& rule,
               procura::schema::timestamp_milliseconds_t now);

}  // namespace procura::policy
