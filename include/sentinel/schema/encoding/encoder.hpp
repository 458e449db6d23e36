#pragma once
#include <sentinel/schema/primitives.hpp>
#include <optional>

namespace sentinel::schema::encoding {

/// Binary codec selected at build time by tag. Persisted audit records go
/// through this interface only, so the wire format can change without
/// touching the journal or the storage layer.
template <typename Library>
struct encoder {
  template <typename T>
  sentinel::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const sentinel::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const sentinel::schema::bytes_view_t& bytes);
};

}  // namespace sentinel::schema::encoding
