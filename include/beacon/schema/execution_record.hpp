#pragma once
#include <beacon/schema/primitives.hpp>

// Schema type: execution record.
// One per executed intent, keyed by the intent id. A zero-valued record
// (created_at == 0) stands for "no execution".
namespace beacon::schema {

template <uint16_t Version>
struct execution_record;

template <>
struct execution_record<1> final {
  uint16_t version{1};
  intent_id_t intent_id{};
  account_id_t executor{};
  amount_t executed_amount{};
  price_t average_price{};
  sequence_t created_at{};
};

using execution_record_t = execution_record<1>;

}  // namespace beacon::schema
