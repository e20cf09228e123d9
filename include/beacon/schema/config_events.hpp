#pragma once
#include <beacon/schema/primitives.hpp>
#include <cstdint>

// Schema types: configuration change notifications.
// Each carries the previous and the new value.
namespace beacon::schema {

template <uint16_t Version>
struct controller_changed;

template <>
struct controller_changed<1> final {
  uint16_t version{1};
  account_id_t previous{};
  account_id_t controller{};
  sequence_t sequence{};
};

using controller_changed_t = controller_changed<1>;

template <uint16_t Version>
struct keeper_changed;

template <>
struct keeper_changed<1> final {
  uint16_t version{1};
  account_id_t previous{};
  account_id_t keeper{};
  sequence_t sequence{};
};

using keeper_changed_t = keeper_changed<1>;

template <uint16_t Version>
struct bounds_changed;

template <>
struct bounds_changed<1> final {
  uint16_t version{1};
  amount_t previous_min_amount{};
  amount_t previous_max_amount{};
  amount_t min_amount{};
  amount_t max_amount{};
  sequence_t sequence{};
};

using bounds_changed_t = bounds_changed<1>;

template <uint16_t Version>
struct fee_changed;

template <>
struct fee_changed<1> final {
  uint16_t version{1};
  uint32_t previous_bps{};
  uint32_t fee_bps{};
  sequence_t sequence{};
};

using fee_changed_t = fee_changed<1>;

template <uint16_t Version>
struct pause_changed;

template <>
struct pause_changed<1> final {
  uint16_t version{1};
  bool paused{};
  sequence_t sequence{};
};

using pause_changed_t = pause_changed<1>;

}  // namespace beacon::schema
