#pragma once
#include <procura/common/critical.hpp>
#include <procura/schema/encoding/encoder.hpp>
#include <procura/schema/encoding/scale/approval_decision.hpp>
#include <procura/schema/encoding/scale/po_status.hpp>
#include <procura/schema/encoding/scale/reservation_status.hpp>
#include <procura/schema/encoding/scale/risk_score.hpp>
#include <procura/schema/encoding/scale/routing_outcome.hpp>
#include <procura/schema/encoding/scale/supplier_status.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace procura::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  procura::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, procura::schema::bytes_t& out);

  template <typename T>
  T decode(const procura::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const procura::schema::bytes_view_t& bytes);
};

template <typename T>
procura::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    procura::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        procura::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const procura::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    procura::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const procura::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace procura::schema::encoding
