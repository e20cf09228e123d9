#pragma once
#include <beacon/schema/primitives.hpp>
#include <cstdint>

// Schema type: registry config.
// Process-wide mutable settings. Owner is fixed at construction; everything
// else is owner-mutable through the configuration operations.
namespace beacon::schema {

template <uint16_t Version>
struct registry_config;

template <>
struct registry_config<1> final {
  uint16_t version{1};
  account_id_t owner{};
  account_id_t controller{};
  account_id_t keeper{};
  bool paused{};
  uint32_t fee_bps{};
  amount_t min_amount{};
  amount_t max_amount{};
};

using registry_config_t = registry_config<1>;

}  // namespace beacon::schema
