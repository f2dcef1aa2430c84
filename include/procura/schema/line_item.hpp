#pragma once
#include <procura/schema/primitives.hpp>
#include <string>

namespace procura::schema {

template <uint16_t Version>
struct line_item;

template <>
struct line_item<1> final {
  uint16_t version{1};
  std::string description;
  uint32_t quantity{};
  amount_t unit_price{};
};

using line_item_t = line_item<1>;

}  // namespace procura::schema
