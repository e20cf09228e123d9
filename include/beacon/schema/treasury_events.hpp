#pragma once
#include <beacon/schema/primitives.hpp>

namespace beacon::schema {

template <uint16_t Version>
struct treasury_topped;

template <>
struct treasury_topped<1> final {
  uint16_t version{1};
  amount_t amount{};
  account_id_t from{};
  sequence_t sequence{};
};

using treasury_topped_t = treasury_topped<1>;

template <uint16_t Version>
struct treasury_withdrawn;

template <>
struct treasury_withdrawn<1> final {
  uint16_t version{1};
  account_id_t to{};
  amount_t amount{};
  sequence_t sequence{};
};

using treasury_withdrawn_t = treasury_withdrawn<1>;

}  // namespace beacon::schema
