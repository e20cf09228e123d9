#pragma once
#include <beacon/schema/intent_side.hpp>
#include <beacon/schema/intent_status.hpp>
#include <beacon/schema/primitives.hpp>

// Schema type: intent state.
// Persisted intent record. `created_at` is the logical sequence at
// submission and doubles as the existence marker (0 = absent).
namespace beacon::schema {

template <uint16_t Version>
struct intent_state;

template <>
struct intent_state<1> final {
  uint16_t version{1};
  intent_id_t intent_id{};
  account_id_t submitter{};
  intent_side_t side{intent_side_t::buy};
  amount_t amount{};
  price_t limit_price{};
  symbol_id_t symbol{};
  sequence_t created_at{};
  amount_t executed_amount{};
  bool executed{};
  bool cancelled{};
};

using intent_state_t = intent_state<1>;

inline intent_status_t status_of(const intent_state_t& intent) {
  if (intent.executed) {
    return intent_status_t::executed;
  }
  if (intent.cancelled) {
    return intent_status_t::cancelled;
  }
  return intent_status_t::pending;
}

}  // namespace beacon::schema
