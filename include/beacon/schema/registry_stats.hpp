#pragma once
#include <beacon/schema/primitives.hpp>
#include <cstdint>

// Schema type: registry stats.
// Aggregate view recomputed by full index scans on every request.
namespace beacon::schema {

template <uint16_t Version>
struct registry_stats;

template <>
struct registry_stats<1> final {
  uint16_t version{1};
  uint64_t total_intents{};
  uint64_t pending{};
  uint64_t executed{};
  uint64_t cancelled{};
  uint64_t total_executions{};
  uint32_t fill_rate_bps{};
  uint32_t cancellation_rate_bps{};
  uint32_t execution_rate_bps{};
  amount_t treasury_balance{};
};

using registry_stats_t = registry_stats<1>;

}  // namespace beacon::schema
