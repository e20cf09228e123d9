#pragma once
#include <beacon/schema/intent_side.hpp>
#include <beacon/schema/primitives.hpp>

// Schema type: intent entry.
// One element of a batch submission.
namespace beacon::schema {

template <uint16_t Version>
struct intent_entry;

template <>
struct intent_entry<1> final {
  uint16_t version{1};
  intent_side_t side{intent_side_t::buy};
  amount_t amount{};
  price_t limit_price{};
  symbol_id_t symbol{};
};

using intent_entry_t = intent_entry<1>;

}  // namespace beacon::schema
