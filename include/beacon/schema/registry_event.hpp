#pragma once
#include <beacon/schema/config_events.hpp>
#include <beacon/schema/intent_events.hpp>
#include <beacon/schema/primitives.hpp>
#include <beacon/schema/treasury_events.hpp>
#include <string_view>
#include <variant>

// Schema type: registry event.
// Notification stream item: delivered to the event sink, returned in the
// operation result, and appended to the persisted event log.
namespace beacon::schema {

using registry_event_t = std::variant<intent_submitted_t,
                                      intent_executed_t,
                                      intent_cancelled_t,
                                      controller_changed_t,
                                      keeper_changed_t,
                                      bounds_changed_t,
                                      fee_changed_t,
                                      pause_changed_t,
                                      treasury_topped_t,
                                      treasury_withdrawn_t>;

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  registry_event_t event{};
};

using event_record_t = event_record<1>;

inline std::string_view event_name(const registry_event_t& event) {
  return std::visit(
      overloaded{
          [](const intent_submitted_t&) { return std::string_view{"IntentSubmitted"}; },
          [](const intent_executed_t&) { return std::string_view{"IntentExecuted"}; },
          [](const intent_cancelled_t&) { return std::string_view{"IntentCancelled"}; },
          [](const controller_changed_t&) { return std::string_view{"ControllerChanged"}; },
          [](const keeper_changed_t&) { return std::string_view{"KeeperChanged"}; },
          [](const bounds_changed_t&) { return std::string_view{"BoundsChanged"}; },
          [](const fee_changed_t&) { return std::string_view{"FeeChanged"}; },
          [](const pause_changed_t&) { return std::string_view{"Paused"}; },
          [](const treasury_topped_t&) { return std::string_view{"TreasuryTopped"}; },
          [](const treasury_withdrawn_t&) { return std::string_view{"TreasuryWithdrawn"}; }},
      event);
}

}  // namespace beacon::schema
