#pragma once

#include <beacon/schema/primitives.hpp>
#include <beacon/schema/registry_event.hpp>
#include <functional>

namespace beacon::execution {

/// Value-transfer primitive used by treasury withdrawal. Returns false when
/// the transfer did not happen.
using transfer_function_t =
    std::function<bool(const beacon::schema::account_id_t& to,
                       const beacon::schema::amount_t& amount)>;

/// Receives every committed state transition, in commit order.
using event_sink_t =
    std::function<void(const beacon::schema::registry_event_t& event)>;

}  // namespace beacon::execution
