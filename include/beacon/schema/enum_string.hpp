#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace beacon::schema {

/// One row of an enum's name table.
template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
using enum_names_t = std::array<enum_name_t<Enum>, N>;

inline constexpr auto kUnknownEnumName = std::string_view{"unknown"};

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> value_of(const std::string_view name,
                                       const enum_names_t<Enum, N>& names) {
  auto found = std::ranges::find(names, name, &enum_name_t<Enum>::first);
  if (found == std::end(names)) {
    return std::nullopt;
  }
  return found->second;
}

/// Name of `value`, or "unknown" for a value outside the table (a corrupt or
/// newer wire value).
template <typename Enum, std::size_t N>
constexpr std::string_view name_of(const Enum value,
                                   const enum_names_t<Enum, N>& names) {
  auto found = std::ranges::find(names, value, &enum_name_t<Enum>::second);
  return found == std::end(names) ? kUnknownEnumName : found->first;
}

/// Parse an enum from its name. Specialised next to each enum that has a
/// name table.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view) {
  return std::nullopt;
}

}  // namespace beacon::schema
