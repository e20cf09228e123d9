#pragma once
#include <beacon/schema/intent_entry.hpp>
#include <beacon/schema/primitives.hpp>
#include <vector>

// Schema type: submit intent batch.
// All-or-nothing submission; `total_fee_paid` must cover every entry.
namespace beacon::schema {

template <uint16_t Version>
struct submit_intent_batch;

template <>
struct submit_intent_batch<1> final {
  uint16_t version{1};
  std::vector<intent_entry_t> entries;
  amount_t total_fee_paid{};
};

using submit_intent_batch_t = submit_intent_batch<1>;

}  // namespace beacon::schema
