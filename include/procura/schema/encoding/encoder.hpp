#pragma once
#include <procura/schema/primitives.hpp>
#include <optional>
#include <span>

namespace procura::schema::encoding {

// The codec is a build time choice selected by tag, the same way the storage
// backend is. Hot swapping is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  procura::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, procura::schema::bytes_t& out);

  template <typename T>
  T decode(const procura::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const procura::schema::bytes_view_t& bytes);
};

}  // namespace procura::schema::encoding
