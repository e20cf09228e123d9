#pragma once

#include <beacon/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Read API envelope: SCALE-encoded value, key echo, the logical sequence the
// answer was computed at, and error metadata.
namespace beacon::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  bytes_t key;
  bytes_t value;
  sequence_t sequence{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace beacon::schema
