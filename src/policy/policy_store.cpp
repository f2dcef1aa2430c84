#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <mutex>
#include <procura/policy/policy_store.hpp>
#include <procura/schema/key/engine_keys.hpp>

using namespace procura::schema;

namespace {

std::size_t distinct_role_count(const approval_rule_t& rule) {
  auto roles = rule.required_approvers;
  std::sort(std::begin(roles), std::end(roles));
  return static_cast<std::size_t>(
      std::distance(std::begin(roles),
                    std::unique(std::begin(roles), std::end(roles))));
}

// Rules arrive in (max_amount, rule_id) order, so keeping the incumbent on
// equal approver counts keeps the lower rule_id.
bool replaces(const approval_rule_t& candidate,
              const std::optional<approval_rule_t>& incumbent) {
  if (!incumbent) {
    return true;
  }
  if (candidate.max_amount != incumbent->max_amount) {
    return candidate.max_amount > incumbent->max_amount;
  }
  return distinct_role_count(candidate) > distinct_role_count(*incumbent);
}

}  // namespace

namespace procura::policy {

bool is_usable(const approval_rule_t& rule,
               const timestamp_milliseconds_t now) {
  if (!rule.active) {
    return false;
  }
  return !rule.expires_at || *rule.expires_at > now;
}

policy_store::policy_store(
    procura::schema::encoding::encoder<
        procura::schema::encoding::scale_encoder_tag>& encoder,
    procura::storage::storage<procura::storage::rocksdb_storage_tag>& storage)
    : encoder_{encoder}, storage_{storage} {}

rule_match policy_store::find_rule(const amount_t amount,
                                   const timestamp_milliseconds_t now) const {
  auto prefix = key::make_prefix_key(encoder_, key::kRuleKeyPrefix);
  auto start = key::make_rule_seek_key(encoder_, amount);

  auto best = std::optional<approval_rule_t>{};
  storage_.scan_from(prefix, start,
                     [&](const bytes_view_t&, const bytes_view_t& value) {
                       auto rule = encoder_.decode<approval_rule_t>(value);
                       if (!is_usable(rule, now)) {
                         return true;
                       }
                       if (best && rule.max_amount != best->max_amount) {
                         return false;
                       }
                       if (replaces(rule, best)) {
                         best = std::move(rule);
                       }
                       return true;
                     });
  if (best) {
    return rule_match{.manual_escalation = false, .rule = std::move(best)};
  }

  auto highest = std::optional<approval_rule_t>{};
  storage_.scan_from(prefix, prefix,
                     [&](const bytes_view_t&, const bytes_view_t& value) {
                       auto rule = encoder_.decode<approval_rule_t>(value);
                       if (is_usable(rule, now) && replaces(rule, highest)) {
                         highest = std::move(rule);
                       }
                       return true;
                     });
  spdlog::warn("No approval bracket covers {}; manual escalation required",
               format_amount(amount));
  return rule_match{.manual_escalation = true, .rule = std::move(highest)};
}

std::vector<approval_rule_t> policy_store::list_rules() const {
  auto rules = std::vector<approval_rule_t>{};
  auto prefix = key::make_prefix_key(encoder_, key::kRuleKeyPrefix);
  for (const auto& [_, value] : storage_.list_by_prefix(prefix)) {
    rules.push_back(encoder_.decode<approval_rule_t>(make_bytes_view(value)));
  }
  return rules;
}

std::optional<approver_state_t> policy_store::find_approver(
    const approver_role_t& role) const {
  return storage_.get<approver_state_t>(
      encoder_, key::make_approver_key(encoder_, role));
}

void policy_store::upsert_rule(const approval_rule_t& rule) {
  auto lock = std::scoped_lock{rules_mutex_};
  auto index_key = key::make_rule_index_key(encoder_, rule.rule_id);
  auto writes = procura::storage::write_set{};
  auto previous = storage_.get<amount_t>(encoder_, index_key);
  if (previous && *previous != rule.max_amount) {
    writes.erase(key::make_rule_key(encoder_, *previous, rule.rule_id));
  }
  writes.put(encoder_, key::make_rule_key(encoder_, rule.max_amount,
                                          rule.rule_id),
             rule);
  writes.put(encoder_, index_key, rule.max_amount);
  storage_.commit(writes);
  spdlog::info("Approval rule {} stored with bracket up to {}", rule.rule_id,
               format_amount(rule.max_amount));
}

void policy_store::upsert_approver(const approver_state_t& approver) {
  storage_.put(encoder_, key::make_approver_key(encoder_, approver.role),
               approver);
  spdlog::info("Approver '{}' stored (active: {})", approver.role,
               approver.active);
}

}  // namespace procura::policy
