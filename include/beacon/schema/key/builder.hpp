#pragma once
#include <beacon/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace beacon::schema::key {

/// Raw key assembly. Positions and ids are written big-endian so that a
/// prefix scan over the store yields them in numeric order.
struct builder final {
  beacon::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const hash32_t& hash);
  builder& write_ordered(uint64_t value);
};

}  // namespace beacon::schema::key
