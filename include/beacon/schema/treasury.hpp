#pragma once
#include <beacon/schema/primitives.hpp>

// Schema types: treasury operations.
// Deposits are open to any caller; withdrawals are owner-only.
namespace beacon::schema {

template <uint16_t Version>
struct deposit_treasury;

template <>
struct deposit_treasury<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using deposit_treasury_t = deposit_treasury<1>;

template <uint16_t Version>
struct withdraw_treasury;

template <>
struct withdraw_treasury<1> final {
  uint16_t version{1};
  account_id_t to{};
  amount_t amount{};
};

using withdraw_treasury_t = withdraw_treasury<1>;

}  // namespace beacon::schema
