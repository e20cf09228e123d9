#pragma once
#include <beacon/schema/primitives.hpp>
#include <optional>

namespace beacon::schema::encoding {

// Codec for values crossing the storage and operation boundaries, selected
// by a library tag. Stored bytes must decode or the process halts; caller
// supplied bytes go through try_decode.
template <typename Library>
struct encoder {
  template <typename T>
  beacon::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const beacon::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const beacon::schema::bytes_view_t& bytes);
};

}  // namespace beacon::schema::encoding
