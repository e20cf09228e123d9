#pragma once
#include <beacon/schema/primitives.hpp>

namespace beacon::schema {

template <uint16_t Version>
struct execute_intent;

template <>
struct execute_intent<1> final {
  uint16_t version{1};
  intent_id_t intent_id{};
  amount_t executed_amount{};
  price_t average_price{};
};

using execute_intent_t = execute_intent<1>;

}  // namespace beacon::schema
