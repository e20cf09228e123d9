#pragma once
#include <beacon/schema/intent_side.hpp>
#include <beacon/schema/primitives.hpp>

// Schema types: intent lifecycle notifications.
namespace beacon::schema {

template <uint16_t Version>
struct intent_submitted;

template <>
struct intent_submitted<1> final {
  uint16_t version{1};
  intent_id_t intent_id{};
  account_id_t submitter{};
  intent_side_t side{intent_side_t::buy};
  amount_t amount{};
  price_t limit_price{};
  symbol_id_t symbol{};
  sequence_t sequence{};
};

using intent_submitted_t = intent_submitted<1>;

template <uint16_t Version>
struct intent_executed;

template <>
struct intent_executed<1> final {
  uint16_t version{1};
  intent_id_t intent_id{};
  account_id_t executor{};
  amount_t executed_amount{};
  price_t average_price{};
  sequence_t sequence{};
};

using intent_executed_t = intent_executed<1>;

template <uint16_t Version>
struct intent_cancelled;

template <>
struct intent_cancelled<1> final {
  uint16_t version{1};
  intent_id_t intent_id{};
  account_id_t cancelled_by{};
  sequence_t sequence{};
};

using intent_cancelled_t = intent_cancelled<1>;

}  // namespace beacon::schema
