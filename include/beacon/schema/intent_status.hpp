#pragma once

#include <beacon/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: intent status.
// Derived from the executed/cancelled flags of an intent; never persisted.
namespace beacon::schema {

enum class intent_status_t : uint8_t { pending = 0, executed = 1, cancelled = 2 };

inline constexpr auto kIntentStatusNames =
    std::array{enum_name_t<intent_status_t>{
                   "pending", intent_status_t::pending},
               enum_name_t<intent_status_t>{
                   "executed", intent_status_t::executed},
               enum_name_t<intent_status_t>{
                   "cancelled", intent_status_t::cancelled}};

template <>
inline std::optional<intent_status_t> try_from_string<intent_status_t>(
    const std::string_view value) {
  return value_of(value, kIntentStatusNames);
}

inline constexpr std::string_view to_string(const intent_status_t value) {
  return name_of(value, kIntentStatusNames);
}

}  // namespace beacon::schema
