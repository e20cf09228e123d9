#pragma once
#include <beacon/schema/primitives.hpp>
#include <cstdint>

// Schema types: owner-only configuration operations.
namespace beacon::schema {

template <uint16_t Version>
struct set_controller;

template <>
struct set_controller<1> final {
  uint16_t version{1};
  account_id_t controller{};
};

using set_controller_t = set_controller<1>;

template <uint16_t Version>
struct set_keeper;

template <>
struct set_keeper<1> final {
  uint16_t version{1};
  account_id_t keeper{};
};

using set_keeper_t = set_keeper<1>;

template <uint16_t Version>
struct set_execution_bounds;

template <>
struct set_execution_bounds<1> final {
  uint16_t version{1};
  amount_t min_amount{};
  amount_t max_amount{};
};

using set_execution_bounds_t = set_execution_bounds<1>;

template <uint16_t Version>
struct set_fee_rate;

template <>
struct set_fee_rate<1> final {
  uint16_t version{1};
  uint32_t fee_bps{};
};

using set_fee_rate_t = set_fee_rate<1>;

template <uint16_t Version>
struct set_paused;

template <>
struct set_paused<1> final {
  uint16_t version{1};
  bool paused{};
};

using set_paused_t = set_paused<1>;

}  // namespace beacon::schema
