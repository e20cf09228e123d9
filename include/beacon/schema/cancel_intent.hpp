#pragma once
#include <beacon/schema/primitives.hpp>

namespace beacon::schema {

template <uint16_t Version>
struct cancel_intent;

template <>
struct cancel_intent<1> final {
  uint16_t version{1};
  intent_id_t intent_id{};
};

using cancel_intent_t = cancel_intent<1>;

}  // namespace beacon::schema
