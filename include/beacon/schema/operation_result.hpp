#pragma once

#include <beacon/schema/primitives.hpp>
#include <beacon/schema/registry_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: operation result.
// Envelope returned by every mutation. `code` 0 is success; on failure no
// state changed and `events` is empty. `data` carries the SCALE-encoded
// return value (new intent id, id list for batches).
namespace beacon::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string codespace;
  std::vector<registry_event_t> events;
};

using operation_result_t = operation_result<1>;

}  // namespace beacon::schema
