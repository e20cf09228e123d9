#pragma once
#include <beacon/schema/cancel_intent.hpp>
#include <beacon/schema/configure.hpp>
#include <beacon/schema/execute_intent.hpp>
#include <beacon/schema/primitives.hpp>
#include <beacon/schema/submit_intent.hpp>
#include <beacon/schema/submit_intent_batch.hpp>
#include <beacon/schema/treasury.hpp>
#include <variant>

namespace beacon::schema {

using operation_payload_t = std::variant<submit_intent_t,
                                         submit_intent_batch_t,
                                         execute_intent_t,
                                         cancel_intent_t,
                                         set_controller_t,
                                         set_keeper_t,
                                         set_execution_bounds_t,
                                         set_fee_rate_t,
                                         set_paused_t,
                                         deposit_treasury_t,
                                         withdraw_treasury_t>;

template <uint16_t Version>
struct operation;

/// A state-changing call: the identity performing it plus what it asks for.
template <>
struct operation<1> final {
  uint16_t version{1};
  account_id_t caller{};
  operation_payload_t payload{};
};

using operation_t = operation<1>;

}  // namespace beacon::schema
