#pragma once

#include <boost/endian/buffers.hpp>
#include <procura/schema/primitives.hpp>

#include <cstdint>
#include <iterator>
#include <string_view>

// Schema key type: engine keys.
// Procurement workflow: canonical key prefixes and key codecs for suppliers,
// budgets, the approval matrix, approvers, reservations and purchase orders.
namespace procura::schema::key {

inline constexpr std::string_view kSupplierKeyPrefix{"PRC|STATE|SUPPLIER|"};
inline constexpr std::string_view kBudgetKeyPrefix{"PRC|STATE|BUDGET|"};
inline constexpr std::string_view kRuleKeyPrefix{"PRC|STATE|RULE|"};
inline constexpr std::string_view kRuleIndexKeyPrefix{"PRC|STATE|RULE_ID|"};
inline constexpr std::string_view kApproverKeyPrefix{"PRC|STATE|APPROVER|"};
inline constexpr std::string_view kReservationKeyPrefix{
    "PRC|STATE|RESERVATION|"};
inline constexpr std::string_view kPurchaseOrderKeyPrefix{"PRC|STATE|PO|"};

template <typename Encoder, typename T>
procura::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
procura::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
procura::schema::bytes_t make_supplier_key(
    Encoder& encoder,
    const procura::schema::supplier_id_t& supplier_id) {
  return make_prefixed_key(encoder, kSupplierKeyPrefix, supplier_id);
}

template <typename Encoder>
procura::schema::bytes_t make_budget_key(
    Encoder& encoder,
    const procura::schema::department_id_t& department_id) {
  return make_prefixed_key(encoder, kBudgetKeyPrefix, department_id);
}

/// Rule rows sort by (max_amount, rule_id). Both are written big-endian so
/// the store's byte order matches numeric order and a seek lands on the
/// tightest bracket directly.
template <typename Encoder>
procura::schema::bytes_t make_rule_key(Encoder& encoder,
                                       procura::schema::amount_t max_amount,
                                       procura::schema::rule_id_t rule_id) {
  auto key = make_prefix_key(encoder, kRuleKeyPrefix);
  auto amount = boost::endian::big_uint64_buf_t{max_amount};
  auto id = boost::endian::big_uint32_buf_t{rule_id};
  key.insert(std::end(key), amount.data(), amount.data() + sizeof(amount));
  key.insert(std::end(key), id.data(), id.data() + sizeof(id));
  return key;
}

/// Seek position for the first bracket able to cover `amount`.
template <typename Encoder>
procura::schema::bytes_t make_rule_seek_key(Encoder& encoder,
                                            procura::schema::amount_t amount) {
  auto key = make_prefix_key(encoder, kRuleKeyPrefix);
  auto bound = boost::endian::big_uint64_buf_t{amount};
  key.insert(std::end(key), bound.data(), bound.data() + sizeof(bound));
  return key;
}

template <typename Encoder>
procura::schema::bytes_t make_rule_index_key(
    Encoder& encoder,
    procura::schema::rule_id_t rule_id) {
  return make_prefixed_key(encoder, kRuleIndexKeyPrefix, rule_id);
}

template <typename Encoder>
procura::schema::bytes_t make_approver_key(
    Encoder& encoder,
    const procura::schema::approver_role_t& role) {
  return make_prefixed_key(encoder, kApproverKeyPrefix, role);
}

template <typename Encoder>
procura::schema::bytes_t make_reservation_key(
    Encoder& encoder,
    const procura::schema::reservation_id_t& reservation_id) {
  return make_prefixed_key(encoder, kReservationKeyPrefix, reservation_id);
}

template <typename Encoder>
procura::schema::bytes_t make_purchase_order_key(
    Encoder& encoder,
    const procura::schema::po_id_t& po_id) {
  return make_prefixed_key(encoder, kPurchaseOrderKeyPrefix, po_id);
}

}  // namespace procura::schema::key
