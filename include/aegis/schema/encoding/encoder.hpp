#pragma once
#include <aegis/schema/primitives.hpp>
#include <optional>
#include <span>

namespace aegis::schema::encoding {

// The codec is a build time choice selected by tag; hot swapping is not a
// goal.
template <typename Library>
struct encoder {
  template <typename T>
  aegis::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, aegis::schema::bytes_t& out);

  template <typename T>
  T decode(const aegis::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const aegis::schema::bytes_view_t& bytes);
};

}  // namespace aegis::schema::encoding
