#pragma once

#include <beacon/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: intent side.
// Trading signal direction; the numeric codes are part of the integrator
// contract (Buy = 1, Sell = 2).
namespace beacon::schema {

enum class intent_side_t : uint8_t { buy = 1, sell = 2 };

inline constexpr auto kIntentSideNames = std::array{
    enum_name_t<intent_side_t>{"buy", intent_side_t::buy},
    enum_name_t<intent_side_t>{"sell", intent_side_t::sell}};

template <>
inline std::optional<intent_side_t> try_from_string<intent_side_t>(
    const std::string_view value) {
  return value_of(value, kIntentSideNames);
}

inline constexpr std::string_view to_string(const intent_side_t value) {
  return name_of(value, kIntentSideNames);
}

inline constexpr bool is_valid(const intent_side_t value) {
  return value == intent_side_t::buy || value == intent_side_t::sell;
}

}  // namespace beacon::schema
