#pragma once

#include <beacon/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: registry error code.
// Stable numeric failure codes for operation and query results, grouped into
// five classes by their leading digit.
namespace beacon::schema {

enum class registry_error_code : uint32_t {
  ok = 0,
  invalid_side = 10,
  zero_amount = 11,
  amount_out_of_bounds = 12,
  bounds_invalid = 13,
  zero_address = 14,
  invalid_operation = 15,
  invalid_query = 16,
  unsupported_path = 17,
  not_found = 20,
  already_executed = 21,
  already_cancelled = 22,
  paused = 23,
  reentrancy = 24,
  unauthorized = 30,
  not_controller = 31,
  not_keeper = 32,
  not_owner = 33,
  capacity_exceeded = 40,
  insufficient_fee = 50,
  transfer_failed = 51,
  balance_overflow = 52,
};

enum class error_class_t : uint8_t {
  none = 0,
  validation = 1,
  state = 2,
  authorization = 3,
  capacity = 4,
  funds = 5,
};

inline constexpr error_class_t classify(const registry_error_code code) {
  switch (static_cast<uint32_t>(code) / 10) {
    case 1:
      return error_class_t::validation;
    case 2:
      return error_class_t::state;
    case 3:
      return error_class_t::authorization;
    case 4:
      return error_class_t::capacity;
    case 5:
      return error_class_t::funds;
    default:
      return error_class_t::none;
  }
}

inline constexpr auto kRegistryErrorCodeNames = std::array{
    enum_name_t<registry_error_code>{"ok",
                                                     registry_error_code::ok},
    enum_name_t<registry_error_code>{
        "invalid side", registry_error_code::invalid_side},
    enum_name_t<registry_error_code>{
        "zero amount", registry_error_code::zero_amount},
    enum_name_t<registry_error_code>{
        "amount out of bounds", registry_error_code::amount_out_of_bounds},
    enum_name_t<registry_error_code>{
        "bounds invalid", registry_error_code::bounds_invalid},
    enum_name_t<registry_error_code>{
        "zero address", registry_error_code::zero_address},
    enum_name_t<registry_error_code>{
        "invalid operation", registry_error_code::invalid_operation},
    enum_name_t<registry_error_code>{
        "invalid query", registry_error_code::invalid_query},
    enum_name_t<registry_error_code>{
        "unsupported path", registry_error_code::unsupported_path},
    enum_name_t<registry_error_code>{
        "not found", registry_error_code::not_found},
    enum_name_t<registry_error_code>{
        "already executed", registry_error_code::already_executed},
    enum_name_t<registry_error_code>{
        "already cancelled", registry_error_code::already_cancelled},
    enum_name_t<registry_error_code>{
        "paused", registry_error_code::paused},
    enum_name_t<registry_error_code>{
        "reentrant call", registry_error_code::reentrancy},
    enum_name_t<registry_error_code>{
        "unauthorized", registry_error_code::unauthorized},
    enum_name_t<registry_error_code>{
        "caller is not the controller", registry_error_code::not_controller},
    enum_name_t<registry_error_code>{
        "caller is not the keeper", registry_error_code::not_keeper},
    enum_name_t<registry_error_code>{
        "caller is not the owner", registry_error_code::not_owner},
    enum_name_t<registry_error_code>{
        "capacity exceeded", registry_error_code::capacity_exceeded},
    enum_name_t<registry_error_code>{
        "insufficient fee", registry_error_code::insufficient_fee},
    enum_name_t<registry_error_code>{
        "transfer failed", registry_error_code::transfer_failed},
    enum_name_t<registry_error_code>{
        "treasury balance overflow", registry_error_code::balance_overflow}};

inline constexpr std::string_view to_string(const registry_error_code value) {
  return name_of(value, kRegistryErrorCodeNames);
}

}  // namespace beacon::schema
