#pragma once
#include <beacon/schema/intent_side.hpp>
#include <beacon/schema/primitives.hpp>

// Schema type: submit intent.
// Controller operation creating one pending intent, paying its fee inline.
namespace beacon::schema {

template <uint16_t Version>
struct submit_intent;

template <>
struct submit_intent<1> final {
  uint16_t version{1};
  intent_side_t side{intent_side_t::buy};
  amount_t amount{};
  price_t limit_price{};
  symbol_id_t symbol{};
  amount_t fee_paid{};
};

using submit_intent_t = submit_intent<1>;

}  // namespace beacon::schema
